#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <ArtifactBuilder.hpp>
#include <BaseTracker.hpp>
#include <Config.hpp>
#include <Logging.hpp>
#include <MetadataResolver.hpp>
#include <ReleaseClassifier.hpp>
#include <SeedingClient.hpp>
#include <UploadJob.hpp>

struct UploadRequest {
    Release release;
    bool preflight_only = false;
};

struct OrchestratorSettings {
    std::optional<std::filesystem::path> torrent_dir;      // keep a copy of every submitted .torrent here
    std::optional<std::string> image_base_url;
};

// Classifying -> Resolving -> Preflight -> Building -> Submitting -> Done, one release at a time.
// Preflight and Submitting fan out over the targets and join before the next stage; a target's
// failure only ever lands in that target's outcome.
class UploadOrchestrator {
public:
    UploadOrchestrator(const Policy& policy, const ReleaseClassifier& classifier, const MetadataResolver& resolver,
                       std::vector<std::shared_ptr<BaseTracker>> targets, ArtifactBuilder& artifacts,
                       SeedingClient* client, OrchestratorSettings settings, Logger& log)
        : policy_(policy), classifier_(classifier), resolver_(resolver), targets_(std::move(targets)),
          artifacts_(artifacts), client_(client), settings_(std::move(settings)), log_(log) {}

    UploadJob run(const UploadRequest& request) const;

    // one line per target, then the overall outcome
    static void report(const UploadJob& job, std::ostream& out);

private:
    ContentType classify(const Release& release) const;
    void preflight(UploadJob& job, const Release& release) const;
    void build_and_submit(UploadJob& job, const Release& release) const;

    // adds a duplicate's torrent to the local client when it is the same files under the same name
    bool cross_seed_duplicate(BaseTracker& target, const PreflightResult& result, const Release& release) const;

    void inject(const std::string& torrent, const std::string& file_name, const Release& release) const;

    Policy policy_;
    const ReleaseClassifier& classifier_;
    const MetadataResolver& resolver_;
    std::vector<std::shared_ptr<BaseTracker>> targets_;
    ArtifactBuilder& artifacts_;
    SeedingClient* client_;
    OrchestratorSettings settings_;
    Logger& log_;
};

// what the local client sees for a release that is already on disk
TorrentFingerprint fingerprint_of(const Release& release);
