#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <BaseTracker.hpp>
#include <Config.hpp>
#include <CrossSeedMatcher.hpp>
#include <Logging.hpp>
#include <SeedingClient.hpp>

struct SyncCandidate {
    std::string tracker;
    CrossSeedCandidate candidate;
    bool added{};
    std::string note;
};

struct SyncReport {
    size_t local_torrents{};
    size_t catalog_torrents{};
    size_t failures{};                      // searches and downloads that did not go through
    std::vector<SyncCandidate> candidates;

    size_t added() const;
};

// Matches what the local client seeds against each tracker's catalog. The client's
// listing is read once; FileLayout matches at or above the action threshold whose
// root name agrees are added with hash checking skipped, everything else is reported.
class CrossSeedSync {
public:
    CrossSeedSync(const Policy& policy, SeedingClient& client, std::vector<std::shared_ptr<BaseTracker>> trackers, Logger& log)
        : policy_(policy), client_(client), trackers_(std::move(trackers)), log_(log) {}

    SyncReport run() const;

    static void report(const SyncReport& report, std::ostream& out);

private:
    void sync_tracker(BaseTracker& tracker, const std::vector<SeedingEntry>& snapshot, SyncReport& report) const;

    Policy policy_;
    SeedingClient& client_;
    std::vector<std::shared_ptr<BaseTracker>> trackers_;
    Logger& log_;
};
