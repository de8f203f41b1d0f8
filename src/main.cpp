#include <iostream>
#include "check_new_line/app.hpp"
#include "check_new_line/cli.hpp"
#include "check_new_line/logging.hpp"

int main(int argc, char* argv[]) {
    const auto options = check_new_line::parse_cli(argc, argv);

    if (options.valid && !options.show_help) {
        check_new_line::init_logging(options.verbose);
    }

    return check_new_line::run(options, argv[0], std::cout, std::cerr);
}
