#pragma once

#include <ig/dictionary.h>
#include <ig/schema.h>
#include <ig/validate.h>

namespace ig {

// Validate one contributed item against the process-wide item schema.
// Throws SchemaError if the schema cannot be loaded; problems in the item
// itself are only ever reported through the result.
ValidationResult validate_entry(const Dictionary& record);

// Same, against a schema the caller already holds.
ValidationResult validate_entry(const Dictionary& record, const SchemaNode& schema);

}  // namespace ig
