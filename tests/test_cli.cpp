#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include "check_new_line/cli.hpp"

using check_new_line::CliParseResult;

namespace {
    CliParseResult parse(std::vector<std::string> args) {
        args.insert(args.begin(), "check-new-line");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return check_new_line::parse_cli(static_cast<int>(argv.size()), argv.data());
    }
}

TEST_CASE("Single directory argument defaults to check mode", "[cli]") {
    const auto result = parse({"repo"});
    REQUIRE(result.valid);
    REQUIRE_FALSE(result.fix);
    REQUIRE_FALSE(result.verbose);
    REQUIRE(result.path.value_or("") == "repo");
}

TEST_CASE("Fix flag forms", "[cli]") {
    REQUIRE(parse({"-fix", "repo"}).fix);
    REQUIRE(parse({"--fix", "repo"}).fix);
    REQUIRE(parse({"-fix=true", "repo"}).fix);
    REQUIRE(parse({"-fix=1", "repo"}).fix);
    REQUIRE_FALSE(parse({"-fix=false", "repo"}).fix);
    REQUIRE_FALSE(parse({"-fix", "-fix=F", "repo"}).fix);
}

TEST_CASE("Verbose flag", "[cli]") {
    REQUIRE(parse({"-v", "repo"}).verbose);
    REQUIRE(parse({"--verbose", "-fix", "repo"}).verbose);
}

TEST_CASE("Missing or extra positional arguments are rejected", "[cli]") {
    const auto none = parse({});
    REQUIRE_FALSE(none.valid);
    REQUIRE(none.error_message == "Missing directory argument.");

    const auto two = parse({"one", "two"});
    REQUIRE_FALSE(two.valid);
    REQUIRE(two.error_message == "Unexpected extra argument: two");
}

TEST_CASE("Flags after the directory are positional", "[cli]") {
    const auto result = parse({"repo", "-fix"});
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.error_message == "Unexpected extra argument: -fix");
}

TEST_CASE("Double dash ends flag parsing", "[cli]") {
    const auto result = parse({"--", "-fix"});
    REQUIRE(result.valid);
    REQUIRE_FALSE(result.fix);
    REQUIRE(result.path.value_or("") == "-fix");

    REQUIRE(parse({"-"}).path.value_or("") == "-");
}

TEST_CASE("Unknown flags and bad values are rejected", "[cli]") {
    const auto unknown = parse({"-recursive", "repo"});
    REQUIRE_FALSE(unknown.valid);
    REQUIRE(unknown.error_message == "flag provided but not defined: -recursive");

    const auto bad_value = parse({"-fix=maybe", "repo"});
    REQUIRE_FALSE(bad_value.valid);
    REQUIRE(bad_value.error_message == "invalid boolean value \"maybe\" for -fix");

    const auto bad_syntax = parse({"---fix", "repo"});
    REQUIRE_FALSE(bad_syntax.valid);
    REQUIRE(bad_syntax.error_message == "bad flag syntax: ---fix");
}

TEST_CASE("Help does not require a directory", "[cli]") {
    for (const char* flag : {"-h", "-help", "--help"}) {
        const auto result = parse({flag});
        REQUIRE(result.valid);
        REQUIRE(result.show_help);
    }
}

TEST_CASE("Boolean values follow the flag syntax", "[cli]") {
    using check_new_line::parse_bool;
    for (const char* value : {"1", "t", "T", "TRUE", "true", "True"}) {
        REQUIRE(parse_bool(value) == std::optional<bool>(true));
    }
    for (const char* value : {"0", "f", "F", "FALSE", "false", "False"}) {
        REQUIRE(parse_bool(value) == std::optional<bool>(false));
    }
    REQUIRE_FALSE(parse_bool("yes").has_value());
    REQUIRE_FALSE(parse_bool("").has_value());
}
