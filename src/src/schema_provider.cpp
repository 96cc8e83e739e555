#include <ig/schema_provider.h>
#include <ig/json.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

#ifndef IG_DEFAULT_SCHEMA_PATH
#define IG_DEFAULT_SCHEMA_PATH "item_schema.json"
#endif

namespace ig {

static bool debug_enabled() { return std::getenv("IG_VALIDATE_DEBUG") != nullptr; }

SchemaNode parse_schema(const std::string& text) {
    Dictionary raw = parse_json(text);
    if (!raw.isMappedObject()) {
        throw SchemaError("item schema root must be a JSON object, found " + raw.typeString());
    }
    return SchemaNode::fromDictionary(raw);
}

SchemaNode load_schema_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw SchemaError("cannot open schema: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (debug_enabled()) {
        std::cerr << "schema: loading '" << path << "' (" << content.size() << " bytes)\n";
    }
    try {
        SchemaNode schema = parse_schema(content);
        if (debug_enabled()) {
            std::cerr << "schema: " << schema.fields().size() << " top-level fields\n";
        }
        return schema;
    } catch (const SchemaError& e) {
        throw SchemaError(path + ": " + e.what());
    } catch (const JsonParseError& e) {
        throw SchemaError(path + ": JSON parse error: " + e.what());
    }
}

std::string schema_path() {
    const char* env = std::getenv("IG_SCHEMA_PATH");
    if (env != nullptr && *env != '\0') return env;
    return IG_DEFAULT_SCHEMA_PATH;
}

const SchemaNode& cached_schema() {
    // initialisation of a function-local static runs once and is
    // thread-safe; if it throws, the next caller tries again
    static const SchemaNode schema = load_schema_file(schema_path());
    return schema;
}

}  // namespace ig
