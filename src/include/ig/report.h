#pragma once

#include <ig/dictionary.h>
#include <ig/validate.h>
#include <string>
#include <vector>

namespace ig {

// Formats validation results for the itemgate CLI
class ReportFormatter {
  public:
    // One violation as {"field", "field_desc", "violation_type"}
    Dictionary toDictionary(const Violation& violation) const;

    // "Item #N: valid" or "Item #N: invalid (K violations)" followed by one
    // numbered line per violation
    std::string formatText(size_t index, const ValidationResult& result) const;

    // Single-line summary of one violation, e.g.
    // "TypeMismatch at 'title': \"Short title\""
    std::string formatViolation(const Violation& violation) const;

    // JSON array with one {"item", "valid", "violations"} object per result
    std::string formatJson(const std::vector<ValidationResult>& results, int indent = 2) const;
};

}  // namespace ig
