#include <vector>
#include <algorithm>
#include <system_error>
#include "check_new_line/checker.hpp"
#include "check_new_line/logging.hpp"
#include "check_new_line/scanner.hpp"
#include "check_new_line/path_filter.hpp"

namespace check_new_line {

    namespace {
        using Path = std::filesystem::path;

        struct WalkContext {
            bool fix = false;
            std::ostream& out;
            RunStats& stats;
            std::string error;
        };

        void visit_file(const Path& path, const Path& relative, WalkContext& context) {
            const std::string display = relative.string();

            if (should_skip(relative)) {
                ++context.stats.skipped;
                LOG_DEBUG << "Skipped by path filter: " << display;
                return;
            }

            const FileCheckResult result = check_and_fix_file(path, context.fix);
            switch (result.status) {
                case NewlineStatus::Failed:
                    ++context.stats.failed;
                    context.out << "Error processing " << display << ": " << result.error_message << "\n";
                    LOG_DEBUG << "Excluded from counters after failure: " << display;
                    return;
                case NewlineStatus::Empty:
                    LOG_DEBUG << "Empty file: " << display;
                    break;
                case NewlineStatus::Binary:
                    LOG_DEBUG << "Binary content: " << display;
                    break;
                case NewlineStatus::Terminated:
                    break;
                case NewlineStatus::Missing:
                    context.stats.missing_newline.push_back(display);
                    break;
                case NewlineStatus::Fixed:
                    ++context.stats.fixed;
                    context.out << "Fixed: " << display << std::endl;
                    break;
            }

            ++context.stats.total_checked;
        }

        bool walk_directory(const Path& directory, const Path& relative, WalkContext& context) {
            std::error_code iterator_error;
            std::filesystem::directory_iterator it(directory, iterator_error);
            std::filesystem::directory_iterator end;

            if (iterator_error) {
                context.error = directory.string() + ": " + iterator_error.message();
                return false;
            }

            std::vector<std::filesystem::directory_entry> entries;
            while (it != end) {
                entries.push_back(*it);
                it.increment(iterator_error);
                if (iterator_error) {
                    context.error = directory.string() + ": " + iterator_error.message();
                    return false;
                }
            }

            std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
                return lhs.path().filename().native() < rhs.path().filename().native();
            });

            for (const auto& entry : entries) {
                const Path child_relative = relative / entry.path().filename();

                std::error_code status_error;
                const auto link_status = entry.symlink_status(status_error);
                if (status_error) {
                    context.error = entry.path().string() + ": " + status_error.message();
                    return false;
                }

                if (std::filesystem::is_directory(link_status)) {
                    if (!walk_directory(entry.path(), child_relative, context)) {
                        return false;
                    }
                    continue;
                }

                visit_file(entry.path(), child_relative, context);
            }

            return true;
        }
    }

    ScanResult scan_repository(const Path& root, bool fix, std::ostream& out) {
        ScanResult result;
        WalkContext context {fix, out, result.stats, {}};

        LOG_INFO << "Scanning " << root.string() << (fix ? " in fix mode" : " in check mode");

        if (!walk_directory(root, Path {}, context)) {
            result.ok = false;
            result.error_message = "failed to walk repository: " + context.error;
            LOG_DEBUG << "Walk aborted: " << context.error;
            return result;
        }

        LOG_INFO << "Scan finished: " << result.stats.total_checked << " checked, "
                 << result.stats.skipped << " skipped, " << result.stats.fixed << " fixed, "
                 << result.stats.missing_newline.size() << " missing, "
                 << result.stats.failed << " failed";
        return result;
    }
}
