#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <Release.hpp>

// bad flags or arguments; main answers these with the usage text and exit status 2
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

struct CommandLine {
    std::optional<std::string> input;
    std::vector<std::string> trackers;          // empty means every enabled tracker
    std::optional<ContentType> type;
    std::optional<unsigned> category_id;
    std::optional<unsigned> type_id;
    bool preflight_only{};
    bool sync{};
    bool help{};
    std::string config_path = "config/config.json";
    std::optional<std::string> log_level;
};

// throws UsageError
CommandLine parse_command_line(int argc, const char* const argv[]);

std::string usage(const std::string& program);
