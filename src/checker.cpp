#include <array>
#include <cerrno>
#include <fcntl.h>
#include <cstring>
#include <fstream>
#include <unistd.h>
#include <sys/stat.h>
#include "check_new_line/checker.hpp"
#include "check_new_line/classifier.hpp"

namespace check_new_line {

    namespace {
        using Path = std::filesystem::path;

        constexpr mode_t kRewriteMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
        constexpr std::size_t kReadChunk = 1 << 15;

        std::string system_error_text(int error_number) {
            if (error_number == 0) {
                return "unknown I/O error";
            }
            return std::strerror(error_number);
        }

        FileCheckResult failed(const std::string& action, const std::string& reason) {
            FileCheckResult result;
            result.status = NewlineStatus::Failed;
            result.error_message = "failed to " + action + " file: " + reason;
            return result;
        }

        FileCheckResult with_status(NewlineStatus status) {
            FileCheckResult result;
            result.status = status;
            return result;
        }
    }

    std::optional<std::string> read_file_content(const Path& path, std::string& error) {
        errno = 0;
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            error = system_error_text(errno);
            return std::nullopt;
        }

        std::string content;
        std::array<char, kReadChunk> buffer {};

        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize bytes_read = file.gcount();
            if (bytes_read > 0) {
                content.append(buffer.data(), static_cast<std::size_t>(bytes_read));
            }
        }

        if (!file.eof()) {
            error = system_error_text(errno);
            return std::nullopt;
        }

        return content;
    }

    std::optional<std::string> write_file_content(const Path& path, const std::string& content) {
        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, kRewriteMode);
        if (fd < 0) {
            return system_error_text(errno);
        }

        std::size_t written = 0;
        while (written < content.size()) {
            const ssize_t count = ::write(fd, content.data() + written, content.size() - written);
            if (count < 0) {
                if (errno == EINTR) {
                    continue;
                }
                const int saved = errno;
                ::close(fd);
                return system_error_text(saved);
            }
            written += static_cast<std::size_t>(count);
        }

        if (::close(fd) != 0) {
            return system_error_text(errno);
        }
        return std::nullopt;
    }

    FileCheckResult check_and_fix_file(const Path& path, bool fix) {
        return check_and_fix_file(path, fix, write_file_content);
    }

    FileCheckResult check_and_fix_file(const Path& path, bool fix, const ContentWriter& writer) {
        std::string read_error;
        auto content = read_file_content(path, read_error);
        if (!content) {
            return failed("read", read_error);
        }

        if (content->empty()) {
            return with_status(NewlineStatus::Empty);
        }
        if (is_binary(*content)) {
            return with_status(NewlineStatus::Binary);
        }
        if (content->back() == '\n') {
            return with_status(NewlineStatus::Terminated);
        }
        if (!fix) {
            return with_status(NewlineStatus::Missing);
        }

        content->push_back('\n');
        if (auto write_error = writer(path, *content)) {
            return failed("write", *write_error);
        }
        return with_status(NewlineStatus::Fixed);
    }
}
