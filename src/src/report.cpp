#include <ig/report.h>
#include <sstream>

namespace ig {

namespace {
    std::string display_path(const std::string& path) { return path.empty() ? std::string("<root>") : path; }
}  // namespace

Dictionary ReportFormatter::toDictionary(const Violation& violation) const {
    Dictionary d;
    d["field"] = violation.path;
    d["field_desc"] = violation.descriptor;
    d["violation_type"] = to_string(violation.kind);
    return d;
}

std::string ReportFormatter::formatViolation(const Violation& violation) const {
    std::ostringstream oss;
    oss << to_string(violation.kind) << " at '" << display_path(violation.path) << "': " << violation.descriptor.dump();
    return oss.str();
}

std::string ReportFormatter::formatText(size_t index, const ValidationResult& result) const {
    std::ostringstream oss;
    oss << "Item #" << index << ": ";
    if (result.is_valid()) {
        oss << "valid";
        return oss.str();
    }
    size_t n = result.violations.size();
    oss << "invalid (" << n << (n == 1 ? " violation)" : " violations)");
    for (size_t i = 0; i < n; ++i) {
        oss << "\n  " << (i + 1) << ". " << formatViolation(result.violations[i]);
    }
    return oss.str();
}

std::string ReportFormatter::formatJson(const std::vector<ValidationResult>& results, int indent) const {
    Dictionary out = Dictionary::array();
    for (size_t i = 0; i < results.size(); ++i) {
        Dictionary item;
        item["item"] = static_cast<int64_t>(i);
        item["valid"] = results[i].is_valid();
        Dictionary violations = Dictionary::array();
        for (auto const& v : results[i].violations) violations.push_back(toDictionary(v));
        item["violations"] = violations;
        out.push_back(item);
    }
    return out.dump(indent);
}

}  // namespace ig
