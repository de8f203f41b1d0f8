#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include "check_new_line/logging.hpp"

namespace check_new_line {

    namespace logging = boost::log;
    namespace expr = boost::log::expressions;

    BOOST_LOG_GLOBAL_LOGGER_INIT(diagnostics, logger_mt) {
        return logger_mt();
    }

    void init_logging(bool verbose) {
        logging::add_common_attributes();

        const auto format = expr::stream
            << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
            << "] <" << logging::trivial::severity << "> "
            << expr::smessage;

        logging::add_console_log(std::clog, logging::keywords::format = format);

        const auto threshold = verbose ? logging::trivial::debug : logging::trivial::warning;
        logging::core::get()->set_filter(logging::trivial::severity >= threshold);
    }
}
