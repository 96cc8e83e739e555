#include <ig/entry.h>
#include <ig/schema_provider.h>

namespace ig {

ValidationResult validate_entry(const Dictionary& record) { return validate_entry(record, cached_schema()); }

ValidationResult validate_entry(const Dictionary& record, const SchemaNode& schema) {
    if (!schema.isMapping()) {
        throw SchemaError("item schema root must be a JSON object");
    }
    ValidationResult result;
    validate(record, schema.fields(), "", result.violations);
    return result;
}

}  // namespace ig
