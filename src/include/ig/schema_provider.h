#pragma once

#include <ig/schema.h>
#include <stdexcept>
#include <string>

namespace ig {

// The schema document could not be read or is not a usable item schema.
struct SchemaError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Build a schema from JSON text. The root must be an object.
SchemaNode parse_schema(const std::string& text);

SchemaNode load_schema_file(const std::string& path);

// IG_SCHEMA_PATH when set, otherwise the schema installed with the library.
std::string schema_path();

// Process-wide schema, loaded from schema_path() on first use and read-only
// afterwards. A failed load throws SchemaError and is retried on the next
// call.
const SchemaNode& cached_schema();

}  // namespace ig
