#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace check_new_line {
    struct CliParseResult {
        bool valid = true;
        bool show_help = false;
        bool fix = false;
        bool verbose = false;
        std::optional<std::string> path;
        std::string error_message;
    };

    enum class NewlineStatus {
        Terminated,
        Empty,
        Binary,
        Missing,
        Fixed,
        Failed
    };

    struct FileCheckResult {
        NewlineStatus status = NewlineStatus::Failed;
        std::string error_message;
    };

    struct RunStats {
        std::size_t total_checked = 0;
        std::size_t skipped = 0;
        std::size_t fixed = 0;
        std::size_t failed = 0;
        std::vector<std::string> missing_newline;
    };

    struct ScanResult {
        bool ok = true;
        std::string error_message;
        RunStats stats;
    };
}
