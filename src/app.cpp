#include <filesystem>
#include <system_error>
#include "check_new_line/app.hpp"
#include "check_new_line/cli.hpp"
#include "check_new_line/render.hpp"
#include "check_new_line/scanner.hpp"

namespace check_new_line {

    namespace {
        constexpr const char* kColorError = "\033[1;31m";
        constexpr const char* kColorReset = "\033[0m";

        int fail(std::ostream& err, const std::string& message) {
            err << kColorError << "Error: " << message << kColorReset << "\n";
            return 1;
        }
    }

    int run(const CliParseResult& options, const std::string& program_name, std::ostream& out, std::ostream& err) {
        if (!options.valid) {
            err << kColorError << options.error_message << kColorReset << "\n";
            err << kColorError << "Usage: " << program_name << " [-fix] <directory>" << kColorReset << "\n";
            return 1;
        }

        if (options.show_help || !options.path) {
            print_help(program_name, out);
            return 0;
        }

        const std::filesystem::path root = *options.path;
        std::error_code status_error;
        const auto status = std::filesystem::status(root, status_error);

        if (status_error || !std::filesystem::exists(status)) {
            const std::string reason = status_error ? status_error.message() : "No such file or directory";
            return fail(err, root.string() + ": " + reason);
        }

        if (!std::filesystem::is_directory(status)) {
            return fail(err, root.string() + " is not a directory");
        }

        const auto result = scan_repository(root, options.fix, out);
        if (!result.ok) {
            return fail(err, result.error_message);
        }

        render_summary(result.stats, options.fix, out);
        return 0;
    }
}
