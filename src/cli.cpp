#include <array>
#include <vector>
#include <ostream>
#include <algorithm>
#include <string_view>
#include "check_new_line/cli.hpp"

namespace check_new_line {

    namespace {
        constexpr std::array<std::string_view, 6> kTrueValues = {"1", "t", "T", "TRUE", "true", "True"};
        constexpr std::array<std::string_view, 6> kFalseValues = {"0", "f", "F", "FALSE", "false", "False"};

        void append_usage(std::ostream& out, const std::string& program_name) {
            out << "Usage: " << program_name << " [-fix] <directory>\n"
                << "\n"
                << "Walk a directory tree and report files that do not end with a newline:\n"
                << "  - Hidden files and directories are skipped\n"
                << "  - Files with common binary extensions are skipped\n"
                << "  - Empty files and binary content are counted but never flagged\n"
                << "\n"
                << "Options:\n"
                << "  -fix                 Fix files that don't end with newline\n"
                << "  -v, -verbose         Write diagnostic logs to standard error\n"
                << "  -h, -help, --help    Show this help message and exit\n";
        }

        bool* find_bool_flag(const std::string& name, CliParseResult& result) {
            if (name == "fix") {
                return &result.fix;
            }
            if (name == "v" || name == "verbose") {
                return &result.verbose;
            }
            return nullptr;
        }

        bool parse_flag(const std::string& argument, CliParseResult& result) {
            std::string name = argument.substr(argument.compare(0, 2, "--") == 0 ? 2 : 1);
            std::optional<std::string> value;

            const auto equals = name.find('=');
            if (equals != std::string::npos) {
                value = name.substr(equals + 1);
                name.erase(equals);
            }

            if (name.empty() || name.front() == '-') {
                result.valid = false;
                result.error_message = "bad flag syntax: " + argument;
                return false;
            }

            if (name == "h" || name == "help") {
                result.show_help = true;
                return true;
            }

            bool* target = find_bool_flag(name, result);
            if (!target) {
                result.valid = false;
                result.error_message = "flag provided but not defined: -" + name;
                return false;
            }

            if (!value) {
                *target = true;
                return true;
            }

            if (auto parsed = parse_bool(*value)) {
                *target = *parsed;
                return true;
            }

            result.valid = false;
            result.error_message = "invalid boolean value \"" + *value + "\" for -" + name;
            return false;
        }
    }

    void print_help(const std::string& program_name, std::ostream& out) {
        append_usage(out, program_name);
    }

    std::optional<bool> parse_bool(const std::string& value) {
        if (std::find(kTrueValues.begin(), kTrueValues.end(), value) != kTrueValues.end()) {
            return true;
        }
        if (std::find(kFalseValues.begin(), kFalseValues.end(), value) != kFalseValues.end()) {
            return false;
        }
        return std::nullopt;
    }

    CliParseResult parse_cli(int argc, char* argv[]) {
        CliParseResult result;
        std::vector<std::string> positional;

        int index = 1;
        for (; index < argc; ++index) {
            std::string argument = argv[index];
            if (argument == "--") {
                ++index;
                break;
            }
            if (argument.size() < 2 || argument.front() != '-') {
                break;
            }
            if (!parse_flag(argument, result)) {
                return result;
            }
        }

        for (; index < argc; ++index) {
            positional.emplace_back(argv[index]);
        }

        if (!result.show_help) {
            if (positional.empty()) {
                result.valid = false;
                result.error_message = "Missing directory argument.";
            } else if (positional.size() > 1) {
                result.valid = false;
                result.error_message = "Unexpected extra argument: " + positional[1];
            } else {
                result.path = positional.front();
            }
        } else if (!positional.empty()) {
            result.path = positional.front();
        }

        return result;
    }
}
