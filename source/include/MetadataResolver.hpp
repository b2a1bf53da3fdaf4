#pragma once

#include <memory>
#include <string>
#include <vector>

#include <Config.hpp>
#include <IdentificationService.hpp>
#include <Logging.hpp>

// Per identifier kind: drop candidates below the threshold, merge equal values,
// accept a lone survivor, otherwise pick the closest title and mark it ambiguous.
IdentitySet reconcile(const std::vector<IdentifierCandidate>& candidates, double threshold,
                      const std::string& parsed_title, const std::string& query);

class MetadataResolver {
public:
    MetadataResolver(std::vector<std::shared_ptr<IdentificationService>> services, const Policy& policy, Logger& log)
        : services_(std::move(services)), policy_(policy), log_(log) {}

    // queries every service supporting the type concurrently and joins them;
    // throws ResolutionError only when every consulted service failed on a video type
    IdentitySet resolve(const Release& release, ContentType type, const ParsedName& parsed) const;

    size_t service_count() const { return services_.size(); }

private:
    std::vector<std::shared_ptr<IdentificationService>> services_;
    Policy policy_;
    Logger& log_;
};
