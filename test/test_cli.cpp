#include <catch2/catch_test_macros.hpp>
#include <ig/json.h>

#include <sys/wait.h>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

// Runs the CLI with stdout only, or stdout and stderr merged
CommandResult run_cli(const std::string& arguments, bool merge_stderr = true) {
    std::array<char, 256> buffer;
    std::string cmd = std::string("\"") + IG_CLI_PATH + "\" " + arguments + (merge_stderr ? " 2>&1" : " 2>/dev/null");
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("popen() failed!");
    }
    std::string output;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        output += buffer.data();
    }
    int status = pclose(pipe);
    if (WIFEXITED(status)) status = WEXITSTATUS(status);
    return {status, output};
}

std::string data_file(const std::string& name) { return std::string("\"") + IG_TEST_DATA_DIR + "/" + name + "\""; }

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("CLI help", "[cli][help]") {
    auto r = run_cli("--help");
    CHECK(r.exit_code == 0);
    CHECK(contains(r.output, "itemgate - Validate contributed items"));
    CHECK(contains(r.output, "USAGE:"));
    CHECK(contains(r.output, "OPTIONS:"));

    auto bare = run_cli("");
    CHECK(bare.exit_code == 2);
    CHECK(contains(bare.output, "USAGE:"));
}

TEST_CASE("CLI exits 0 when every item is valid", "[cli]") {
    auto r = run_cli(data_file("items_valid.json"));
    CHECK(r.exit_code == 0);
    CHECK(contains(r.output, "Item #0: valid"));
    CHECK(contains(r.output, "Item #1: valid"));
}

TEST_CASE("CLI accepts a single item object", "[cli]") {
    auto r = run_cli(data_file("item_single.json"));
    CHECK(r.exit_code == 0);
    CHECK(r.output == "Item #0: valid\n");
}

TEST_CASE("CLI exits 1 when an item is invalid", "[cli]") {
    auto r = run_cli(data_file("items_mixed.json"));
    CHECK(r.exit_code == 1);
    CHECK(contains(r.output, "Item #0: valid"));
    CHECK(contains(r.output, "Item #1: invalid (5 violations)"));
    CHECK(contains(r.output, "1. TypeMismatch at 'title'"));
    CHECK(contains(r.output, "MissingField at 'item_metadata.contributor.email'"));
}

TEST_CASE("CLI quiet mode only prints failures", "[cli]") {
    auto r = run_cli("-q " + data_file("items_mixed.json"));
    CHECK(r.exit_code == 1);
    CHECK_FALSE(contains(r.output, "Item #0"));
    CHECK(contains(r.output, "Item #1: invalid"));

    auto clean = run_cli("--quiet " + data_file("items_valid.json"));
    CHECK(clean.exit_code == 0);
    CHECK(clean.output.empty());
}

TEST_CASE("CLI JSON output", "[cli][json]") {
    auto r = run_cli("--json " + data_file("items_mixed.json"), false);
    CHECK(r.exit_code == 1);
    auto report = ig::parse_json(r.output);
    REQUIRE(report.size() == 2);
    CHECK(report.at(0).at("valid").asBool());
    CHECK(report.at(1).at("violations").size() == 5);
    CHECK(report.at(1).at("violations").at(0).at("field").asString() == "title");
    CHECK(report.at(1).at("violations").at(0).at("violation_type").asString() == "TypeMismatch");
}

TEST_CASE("CLI schema selection", "[cli][schema]") {
    SECTION("--schema") {
        auto r = run_cli("--schema " + data_file("schema_small.json") + " " + data_file("items_valid.json"));
        // the small schema requires a score that the items do not carry
        CHECK(r.exit_code == 1);
        CHECK(contains(r.output, "MissingField at 'score'"));
    }

    SECTION("IG_SCHEMA_PATH") {
        auto r = run_cli(data_file("items_valid.json") + " -v");
        CHECK(r.exit_code == 0);

        std::string cmd = "IG_SCHEMA_PATH=" + data_file("schema_small.json") + " \"" + IG_CLI_PATH + "\" " +
                          data_file("items_valid.json") + " > /dev/null 2>&1";
        int status = std::system(cmd.c_str());
        REQUIRE(WIFEXITED(status));
        CHECK(WEXITSTATUS(status) == 1);
    }

    SECTION("a broken schema is a usage error") {
        auto r = run_cli("-s " + data_file("bad_schema.json") + " " + data_file("items_valid.json"));
        CHECK(r.exit_code == 2);
        CHECK(contains(r.output, "schema error:"));
    }
}

TEST_CASE("CLI input and usage errors exit 2", "[cli][errors]") {
    SECTION("malformed input") {
        auto r = run_cli(data_file("items_malformed.json"));
        CHECK(r.exit_code == 2);
        CHECK(contains(r.output, "JSON parse error"));
    }

    SECTION("missing input file") {
        auto r = run_cli(data_file("no_such_items.json"));
        CHECK(r.exit_code == 2);
        CHECK(contains(r.output, "cannot open file"));
    }

    SECTION("unknown option") {
        auto r = run_cli("--verbsoe " + data_file("items_valid.json"));
        CHECK(r.exit_code == 2);
        CHECK(contains(r.output, "Did you mean '--verbose'?"));
        CHECK(contains(r.output, "itemgate --help"));
    }
}
