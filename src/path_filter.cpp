#include <array>
#include <cctype>
#include <algorithm>
#include <string_view>
#include "check_new_line/path_filter.hpp"

namespace check_new_line {

    namespace {
        constexpr std::array<std::string_view, 36> kBinaryExtensions = {
            ".exe", ".dll", ".so", ".dylib", ".a", ".o",
            ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".ico", ".svg",
            ".mp3", ".mp4", ".avi", ".mov", ".wav",
            ".zip", ".tar", ".gz", ".bz2", ".7z", ".rar",
            ".pdf", ".doc", ".docx", ".xls", ".xlsx",
            ".pyc", ".pyo", ".class", ".jar",
            ".db", ".sqlite", ".sqlite3"};

        std::string to_lowercase(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::string_view last_segment(std::string_view generic) {
            const auto slash = generic.find_last_of('/');
            return slash == std::string_view::npos ? generic : generic.substr(slash + 1);
        }
    }

    bool is_hidden_path(const std::filesystem::path& path) {
        const std::string generic = path.generic_string();
        std::string_view rest = generic;

        while (!rest.empty()) {
            const auto slash = rest.find('/');
            const std::string_view segment = rest.substr(0, slash);
            if (!segment.empty() && segment.front() == '.' && segment != ".") {
                return true;
            }
            if (slash == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(slash + 1);
        }

        return false;
    }

    std::string lowercase_extension(const std::filesystem::path& path) {
        const std::string generic = path.generic_string();
        const std::string_view name = last_segment(generic);
        const auto dot = name.find_last_of('.');
        if (dot == std::string_view::npos) {
            return {};
        }
        return to_lowercase(std::string(name.substr(dot)));
    }

    bool is_binary_extension(const std::filesystem::path& path) {
        const std::string lowered = lowercase_extension(path);
        if (lowered.empty()) {
            return false;
        }
        return std::any_of(kBinaryExtensions.begin(), kBinaryExtensions.end(), [&](std::string_view ext) {
            return lowered == ext;
        });
    }

    bool should_skip(const std::filesystem::path& path) {
        return is_hidden_path(path) || is_binary_extension(path);
    }
}
