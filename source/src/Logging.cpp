#include <Logging.hpp>
#include <Errors.hpp>

#include <iostream>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace logging  = boost::log;
namespace expr     = boost::log::expressions;
namespace keywords = boost::log::keywords;

boost::log::trivial::severity_level parse_severity(const std::string& level) {
    using boost::log::trivial::severity_level;

    if (level == "trace")   return severity_level::trace;
    if (level == "debug")   return severity_level::debug;
    if (level == "info")    return severity_level::info;
    if (level == "warning") return severity_level::warning;
    if (level == "error")   return severity_level::error;
    if (level == "fatal")   return severity_level::fatal;

    throw ConfigError("unknown log level '" + level + "'");
}

Logging::Logging(const LoggingConfig& config) {
    auto threshold = parse_severity(config.level);

    logging::add_common_attributes();

    auto format = expr::stream
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S") << "] "
        << "[" << logging::trivial::severity << "] "
        << expr::smessage;

    if (config.console) {
        console_sink_ = logging::add_console_log(std::clog, keywords::format = format);
    }

    if (config.file) {
        file_sink_ = logging::add_file_log(
            keywords::file_name = *config.file,
            keywords::open_mode = std::ios_base::out | std::ios_base::app,
            keywords::auto_flush = true,
            keywords::format = format
        );
    }

    logging::core::get()->set_filter(logging::trivial::severity >= threshold);
}

Logging::~Logging() {
    auto core = logging::core::get();
    core->flush();
    if (console_sink_) core->remove_sink(console_sink_);
    if (file_sink_) core->remove_sink(file_sink_);
}
