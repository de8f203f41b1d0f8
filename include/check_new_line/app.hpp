#pragma once
#include <ostream>
#include <string>
#include "check_new_line/types.hpp"

namespace check_new_line {
    // Runs one invocation for already parsed options and returns the process
    // exit code. Report text goes to out, usage and fatal errors to err.
    int run(const CliParseResult& options, const std::string& program_name, std::ostream& out, std::ostream& err);
}
