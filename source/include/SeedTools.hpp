#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CommandLine.hpp>
#include <Config.hpp>
#include <HttpClient.hpp>
#include <IdentificationService.hpp>
#include <Logging.hpp>
#include <SeedingClient.hpp>

// Wires configuration into the collaborators and runs one mode. Returns the process exit status.
class SeedTools {
public:
    SeedTools(AppConfig config, Logger& log) : config_(std::move(config)), log_(log) {}

    int run(const CommandLine& cli);

    // named trackers in order, or every enabled one; throws UsageError for an unknown name
    std::vector<TrackerTarget> select_targets(const std::vector<std::string>& names) const;

    // --type wins; a bare category id maps back through the first target, unknown ids become Other
    static std::optional<ContentType> type_override(const CommandLine& cli, std::vector<TrackerTarget>& targets);

private:
    int upload(const CommandLine& cli);
    int sync(const CommandLine& cli);

    std::vector<std::shared_ptr<IdentificationService>> identification_services();
    std::unique_ptr<SeedingClient> seeding_client();

    AppConfig config_;
    Logger& log_;
    BeastHttpClient http_;
};
