#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "check_new_line/types.hpp"

namespace check_new_line {
    // Writers return an error description, or nothing on success.
    using ContentWriter = std::function<std::optional<std::string>(const std::filesystem::path&, const std::string&)>;

    std::optional<std::string> read_file_content(const std::filesystem::path& path, std::string& error);
    std::optional<std::string> write_file_content(const std::filesystem::path& path, const std::string& content);

    // Classifies one file and, when fix is set, appends the missing trailing
    // newline in place. Read and write failures come back as NewlineStatus::Failed.
    FileCheckResult check_and_fix_file(const std::filesystem::path& path, bool fix);
    FileCheckResult check_and_fix_file(const std::filesystem::path& path, bool fix, const ContentWriter& writer);
}
