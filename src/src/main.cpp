// itemgate - batch validation of contributed items against the item schema

#include <ig/cli_args.h>
#include <ig/entry.h>
#include <ig/json.h>
#include <ig/report.h>
#include <ig/schema_provider.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

struct InputError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputError("cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// A JSON array is a batch; a single object is a batch of one.
std::vector<ig::Dictionary> readItems(const std::string& path) {
    ig::Dictionary input;
    try {
        input = ig::parse_json(readFile(path));
    } catch (const ig::JsonParseError& e) {
        throw InputError("JSON parse error in " + path + ": " + e.what());
    }
    if (input.isArrayObject()) return input.elements();
    return {input};
}

}  // namespace

int main(int argc, const char* argv[]) {
    try {
        ig::CliArgs args(argc, argv);

        if (args.getAction() == ig::CliArgs::Action::HELP) {
            std::cout << ig::usage();
            return argc < 2 ? 2 : 0;
        }

        std::vector<ig::Dictionary> items = readItems(args.getInputPath());
        if (args.verbose()) {
            std::cerr << "itemgate: read " << items.size() << " item(s) from " << args.getInputPath() << "\n";
        }

        std::vector<ig::ValidationResult> results;
        results.reserve(items.size());
        if (args.hasSchemaPath()) {
            if (args.verbose()) std::cerr << "itemgate: schema " << args.getSchemaPath() << "\n";
            ig::SchemaNode schema = ig::load_schema_file(args.getSchemaPath());
            for (auto const& item : items) results.push_back(ig::validate_entry(item, schema));
        } else {
            if (args.verbose()) std::cerr << "itemgate: schema " << ig::schema_path() << "\n";
            for (auto const& item : items) results.push_back(ig::validate_entry(item));
        }

        size_t invalid = 0;
        for (auto const& r : results)
            if (!r.is_valid()) ++invalid;
        if (args.verbose()) {
            std::cerr << "itemgate: " << results.size() << " item(s) checked, " << invalid << " invalid\n";
        }

        ig::ReportFormatter formatter;
        if (args.outputAsJson()) {
            std::cout << formatter.formatJson(results) << "\n";
        } else {
            for (size_t i = 0; i < results.size(); ++i) {
                if (args.quiet() && results[i].is_valid()) continue;
                std::cout << formatter.formatText(i, results[i]) << "\n";
            }
        }
        return invalid == 0 ? 0 : 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "Try 'itemgate --help' for more information.\n";
        return 2;
    } catch (const ig::SchemaError& e) {
        std::cerr << "schema error: " << e.what() << "\n";
        return 2;
    } catch (const InputError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
