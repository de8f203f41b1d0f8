#include "check_new_line/render.hpp"

namespace check_new_line {

    namespace {
        void render_fix_summary(const RunStats& stats, std::ostream& out) {
            out << "Files fixed: " << stats.fixed << "\n";
            if (stats.fixed == 0) {
                out << "All files already end with newline!\n";
            }
        }

        void render_check_summary(const RunStats& stats, std::ostream& out) {
            out << "Files missing newline: " << stats.missing_newline.size() << "\n";
            if (stats.missing_newline.empty()) {
                out << "All files end with newline!\n";
                return;
            }

            out << "\nFiles that don't end with newline:\n";
            for (const auto& path : stats.missing_newline) {
                out << "  - " << path << "\n";
            }
            out << "\nRun with -fix flag to automatically add newlines\n";
        }
    }

    void render_summary(const RunStats& stats, bool fix, std::ostream& out) {
        out << "\n=== Summary ===\n";
        out << "Total files checked: " << stats.total_checked << "\n";
        out << "Files skipped: " << stats.skipped << "\n";

        if (fix) {
            render_fix_summary(stats, out);
        } else {
            render_check_summary(stats, out);
        }
    }
}
