#pragma once

#include <ig/dictionary.h>
#include <ig/schema.h>
#include <cstddef>
#include <string>
#include <vector>

namespace ig {

enum class ViolationKind {
    MissingField,      // required key absent
    NullOrEmptyValue,  // required string is null, or a must-be-non-empty list is empty
    TypeMismatch,
};

const char* to_string(ViolationKind kind) noexcept;

struct Violation {
    // dotted path with list indices, e.g. "item_metadata.contributor.email"
    // or "responses[2].score"; empty for the record itself
    std::string path;
    // schema value the field was checked against
    Dictionary descriptor;
    ViolationKind kind = ViolationKind::TypeMismatch;
};

struct ValidationResult {
    std::vector<Violation> violations;

    bool is_valid() const noexcept { return violations.empty(); }
    std::size_t count(ViolationKind kind) const noexcept;
};

// Descriptor reported when a value that must be an object is not one.
extern const char* const kExpectedObjectDescriptor;

// Lists named "responses" or ending in "_content" must not be empty.
bool requires_non_empty(const std::string& field_name);

// Walk `data` against the fields of a mapping schema and append every
// discrepancy to `out`, in schema declaration order. Never throws for
// problems in the data.
void validate(const Dictionary& data,
              const SchemaNode::Fields& schema,
              const std::string& path,
              std::vector<Violation>& out);

}  // namespace ig
