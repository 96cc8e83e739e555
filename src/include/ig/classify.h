#pragma once

#include <ig/schema.h>
#include <ig/tag.h>

namespace ig {

// What the validator expects for one schema field.
enum class ValidationKind {
    Auto,                // system-generated, never checked
    Optional,            // may be absent, never checked
    RequiredString,
    RequiredAny,
    RequiredNumeric,
    RequiredObject,
    RequiredStringList,  // list of scalars, element type from the tag if any
    RequiredDictList,    // list of objects validated against a template
};

// Classification of a tagged schema string.
ValidationKind classify(const Tag& tag) noexcept;

// Pure and total: shapes that cannot be validated classify as Auto.
ValidationKind classify(const SchemaNode& node) noexcept;

const char* to_string(ValidationKind kind) noexcept;

}  // namespace ig
