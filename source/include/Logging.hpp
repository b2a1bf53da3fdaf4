#pragma once

#include <optional>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sinks/sink.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

using Logger = boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>;

#define SEEDTOOLS_LOG(logger, sev) BOOST_LOG_SEV(logger, ::boost::log::trivial::sev)

struct LoggingConfig {
    std::string level = "info";                 // trace, debug, info, warning, error, fatal
    bool console = true;
    std::optional<std::string> file;
};

boost::log::trivial::severity_level parse_severity(const std::string& level);

// Sets up the sinks on construction and removes them again on destruction.
// Exactly one of these lives in main; everything else gets the Logger by reference.
class Logging {
public:
    explicit Logging(const LoggingConfig& config);
    ~Logging();

    Logging(const Logging&) = delete;
    Logging& operator=(const Logging&) = delete;

    Logger& logger() { return logger_; }

private:
    Logger logger_;
    boost::shared_ptr<boost::log::sinks::sink> console_sink_;
    boost::shared_ptr<boost::log::sinks::sink> file_sink_;
};
