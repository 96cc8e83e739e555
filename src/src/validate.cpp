#include <ig/validate.h>
#include <ig/classify.h>
#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace ig {

const char* const kExpectedObjectDescriptor = "expected a JSON object";

static bool debug_enabled() {
    static const bool on = std::getenv("IG_VALIDATE_DEBUG") != nullptr;
    return on;
}

static std::string value_type_name(const Dictionary& d) {
    switch (d.type()) {
        case Dictionary::Object:
            return "object";
        case Dictionary::Array:
            return "array";
        case Dictionary::String:
            return "string";
        case Dictionary::Integer:
            return "integer";
        case Dictionary::Double:
            return "number";
        case Dictionary::Boolean:
            return "boolean";
        case Dictionary::Null:
            return "null";
    }
    return "unknown";
}

static std::string join_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

static std::string index_path(const std::string& path, size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

static void report(std::vector<Violation>& out,
                   const std::string& path,
                   const SchemaNode& node,
                   ViolationKind kind) {
    out.push_back(Violation{path, node.describe(), kind});
}

// Element types a list field constrains its elements to, if any.
static const TypeSet* element_types(const SchemaNode& node) {
    if (node.isTagged()) {
        const TypeSet& t = node.tag().element_types;
        return t.empty() ? nullptr : &t;
    }
    if (node.isListTemplate() && node.element() != nullptr && node.element()->isTagged()) {
        const TypeSet& t = node.element()->tag().types;
        return t.empty() ? nullptr : &t;
    }
    return nullptr;
}

// Checks shared by both list kinds. Returns false when the value is not a
// list and element checks must be skipped.
static bool check_list(const Dictionary& value,
                       const std::string& key,
                       const std::string& field_path,
                       const SchemaNode& node,
                       std::vector<Violation>& out) {
    if (!value.isArrayObject()) {
        report(out, field_path, node, ViolationKind::TypeMismatch);
        return false;
    }
    if (value.empty() && requires_non_empty(key)) {
        report(out, field_path, node, ViolationKind::NullOrEmptyValue);
    }
    return true;
}

const char* to_string(ViolationKind kind) noexcept {
    switch (kind) {
        case ViolationKind::MissingField:
            return "MissingField";
        case ViolationKind::NullOrEmptyValue:
            return "NullOrEmptyValue";
        case ViolationKind::TypeMismatch:
            return "TypeMismatch";
    }
    return "Unknown";
}

std::size_t ValidationResult::count(ViolationKind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(
                violations.begin(), violations.end(), [kind](const Violation& v) { return v.kind == kind; }));
}

bool requires_non_empty(const std::string& field_name) {
    static const std::string suffix = "_content";
    if (field_name == "responses") return true;
    return field_name.size() >= suffix.size() &&
           field_name.compare(field_name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void validate(const Dictionary& data,
              const SchemaNode::Fields& schema,
              const std::string& path,
              std::vector<Violation>& out) {
    if (!data.isMappedObject()) {
        if (debug_enabled()) {
            std::cerr << "validate: '" << path << "' is " << value_type_name(data) << ", expected object\n";
        }
        out.push_back(Violation{path, Dictionary(kExpectedObjectDescriptor), ViolationKind::TypeMismatch});
        return;
    }

    for (auto const& field : schema) {
        const std::string& key = field.first;
        const SchemaNode& node = field.second;
        const std::string field_path = join_path(path, key);
        const ValidationKind kind = classify(node);
        const bool present = data.has(key);

        if (debug_enabled()) {
            std::cerr << "validate: field='" << field_path << "' kind=" << to_string(kind)
                      << " value=" << (present ? value_type_name(data.at(key)) : std::string("<absent>")) << "\n";
        }

        switch (kind) {
            case ValidationKind::Auto:
            case ValidationKind::Optional:
                break;

            case ValidationKind::RequiredString: {
                if (!present) {
                    report(out, field_path, node, ViolationKind::MissingField);
                    break;
                }
                const Dictionary& v = data.at(key);
                if (v.isNull())
                    report(out, field_path, node, ViolationKind::NullOrEmptyValue);
                else if (!v.isString())
                    report(out, field_path, node, ViolationKind::TypeMismatch);
                break;
            }

            case ValidationKind::RequiredAny:
                if (!present) report(out, field_path, node, ViolationKind::MissingField);
                break;

            case ValidationKind::RequiredNumeric:
                if (!present) {
                    report(out, field_path, node, ViolationKind::MissingField);
                } else if (!node.tag().types.accepts(data.at(key))) {
                    report(out, field_path, node, ViolationKind::TypeMismatch);
                }
                break;

            case ValidationKind::RequiredObject: {
                if (!present) {
                    report(out, field_path, node, ViolationKind::MissingField);
                    break;
                }
                const Dictionary& v = data.at(key);
                if (!v.isMappedObject()) {
                    report(out, field_path, node, ViolationKind::TypeMismatch);
                    break;
                }
                validate(v, node.fields(), field_path, out);
                break;
            }

            case ValidationKind::RequiredStringList: {
                if (!present) {
                    report(out, field_path, node, ViolationKind::MissingField);
                    break;
                }
                const Dictionary& v = data.at(key);
                if (!check_list(v, key, field_path, node, out)) break;
                const TypeSet* allowed = element_types(node);
                if (allowed == nullptr) break;
                const auto& elements = v.elements();
                for (size_t i = 0; i < elements.size(); ++i) {
                    if (!allowed->matchesElement(elements[i])) {
                        report(out, index_path(field_path, i), node, ViolationKind::TypeMismatch);
                    }
                }
                break;
            }

            case ValidationKind::RequiredDictList: {
                if (!present) {
                    report(out, field_path, node, ViolationKind::MissingField);
                    break;
                }
                const Dictionary& v = data.at(key);
                if (!check_list(v, key, field_path, node, out)) break;
                const SchemaNode::Fields& templ = node.element()->fields();
                const auto& elements = v.elements();
                for (size_t i = 0; i < elements.size(); ++i) {
                    validate(elements[i], templ, index_path(field_path, i), out);
                }
                break;
            }
        }
    }
}

}  // namespace ig
