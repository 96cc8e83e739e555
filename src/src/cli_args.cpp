#include <ig/cli_args.h>
#include <ig/cli_utils.h>
#include <stdexcept>
#include <vector>

namespace ig {

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    static const std::vector<std::string> valid_options = {
                "--help", "-h", "--schema", "-s", "--json", "--quiet", "-q", "--verbose", "-v"};

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        } else if (arg == "--schema" || arg == "-s") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--schema requires a file argument");
            }
            schemaPath_ = argv[++i];
        } else if (arg == "--json") {
            asJson_ = true;
        } else if (arg == "--quiet" || arg == "-q") {
            quiet_ = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument(cli_utils::unknown_option_message(arg, valid_options));
        } else {
            if (!inputPath_.empty()) {
                throw std::invalid_argument("only one input file may be given (got '" + inputPath_ + "' and '" +
                                            arg + "')");
            }
            inputPath_ = arg;
        }
    }

    if (inputPath_.empty()) {
        throw std::invalid_argument("missing input file");
    }
    action_ = Action::VALIDATE;
}

std::string usage() {
    return "itemgate - Validate contributed items against the item schema\n"
           "\n"
           "USAGE:\n"
           "  itemgate [OPTIONS] <items.json>\n"
           "\n"
           "The input is a JSON array of items, or a single item object.\n"
           "\n"
           "OPTIONS:\n"
           "  -s, --schema <file>  Validate against this schema instead of the default\n"
           "                       (IG_SCHEMA_PATH or the installed item schema)\n"
           "      --json           Print the report as JSON\n"
           "  -q, --quiet          Only print items that fail validation\n"
           "  -v, --verbose        Print progress information to stderr\n"
           "  -h, --help           Show this help message\n"
           "\n"
           "EXIT STATUS:\n"
           "  0 all items valid, 1 at least one invalid item, 2 usage or input error\n";
}

}  // namespace ig
