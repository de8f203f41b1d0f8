#pragma once
#include <optional>
#include <ostream>
#include <string>
#include "check_new_line/types.hpp"

namespace check_new_line {
    void print_help(const std::string& program_name, std::ostream& out);
    std::optional<bool> parse_bool(const std::string& value);

    // Flags are read up to the first positional argument or "--"; everything
    // after that is positional.
    CliParseResult parse_cli(int argc, char* argv[]);
}
