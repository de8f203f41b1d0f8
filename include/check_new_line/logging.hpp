#pragma once
#include <boost/log/trivial.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

#define CHECK_NEW_LINE_LOG(LEVEL) \
    BOOST_LOG_SEV(::check_new_line::diagnostics::get(), ::boost::log::trivial::LEVEL)

#define LOG_DEBUG CHECK_NEW_LINE_LOG(debug)
#define LOG_INFO CHECK_NEW_LINE_LOG(info)
#define LOG_WARNING CHECK_NEW_LINE_LOG(warning)
#define LOG_ERROR CHECK_NEW_LINE_LOG(error)

namespace check_new_line {
    using logger_mt = boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>;

    BOOST_LOG_GLOBAL_LOGGER(diagnostics, logger_mt)

    // Routes diagnostics to std::clog. Warnings and above by default, everything
    // from debug up when verbose is set.
    void init_logging(bool verbose);
}
