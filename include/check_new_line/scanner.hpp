#pragma once
#include <filesystem>
#include <ostream>
#include "check_new_line/types.hpp"

namespace check_new_line {
    // Walks root depth-first, entries of each directory in lexical order, and
    // checks every non-directory entry the path filter lets through. Per-file
    // "Fixed:" and "Error processing" lines go to out as they happen. A
    // directory that cannot be listed aborts the walk with ok == false.
    ScanResult scan_repository(const std::filesystem::path& root, bool fix, std::ostream& out);
}
