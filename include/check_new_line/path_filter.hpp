#pragma once
#include <filesystem>
#include <string>

namespace check_new_line {
    bool is_hidden_path(const std::filesystem::path& path);
    bool is_binary_extension(const std::filesystem::path& path);

    // Lowercased extension of the last path segment, dot included; empty if the
    // segment has no dot.
    std::string lowercase_extension(const std::filesystem::path& path);

    bool should_skip(const std::filesystem::path& path);
}
