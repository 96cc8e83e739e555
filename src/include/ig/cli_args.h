#pragma once

#include <string>

namespace ig {

// Parses command-line arguments for the itemgate tool.
// Throws std::invalid_argument on malformed command lines.
class CliArgs {
  public:
    enum class Action {
        HELP,     // Show help message
        VALIDATE  // Validate the records in the input file
    };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::string& getInputPath() const { return inputPath_; }
    bool hasSchemaPath() const { return !schemaPath_.empty(); }
    const std::string& getSchemaPath() const { return schemaPath_; }
    bool outputAsJson() const { return asJson_; }
    bool quiet() const { return quiet_; }
    bool verbose() const { return verbose_; }

  private:
    Action action_ = Action::HELP;
    std::string inputPath_;
    std::string schemaPath_;
    bool asJson_ = false;
    bool quiet_ = false;
    bool verbose_ = false;
};

// Text printed for --help
std::string usage();

}  // namespace ig
