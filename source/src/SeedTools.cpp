#include <SeedTools.hpp>
#include <CrossSeedSync.hpp>
#include <Errors.hpp>
#include <MediaTools.hpp>
#include <MetadataResolver.hpp>
#include <OpenLibraryService.hpp>
#include <QBittorrentClient.hpp>
#include <TmdbService.hpp>
#include <TrackerFactory.hpp>
#include <TvMazeService.hpp>
#include <UploadOrchestrator.hpp>

#include <algorithm>
#include <iostream>

int SeedTools::run(const CommandLine& cli) {
    try {
        return cli.sync ? sync(cli) : upload(cli);
    } catch (const UsageError&) {
        throw;
    } catch (const std::exception& e) {
        SEEDTOOLS_LOG(log_, fatal) << e.what();
        return 1;
    }
}

std::vector<TrackerTarget> SeedTools::select_targets(const std::vector<std::string>& names) const {
    std::vector<TrackerTarget> targets;

    if (names.empty()) {
        for (const auto& t : config_.trackers) {
            if (t.enabled) targets.push_back(t);
        }
        return targets;
    }

    for (const auto& name : names) {
        const auto* target = config_.find_tracker(name);
        if (!target) throw UsageError("unknown tracker '" + name + "'");
        if (!target->enabled) throw ConfigError("tracker '" + name + "' is disabled");

        bool listed = std::any_of(targets.begin(), targets.end(), [&](const auto& t) { return t.name == name; });
        if (!listed) targets.push_back(*target);
    }
    return targets;
}

std::optional<ContentType> SeedTools::type_override(const CommandLine& cli, std::vector<TrackerTarget>& targets) {
    if (!cli.type && !cli.category_id) return std::nullopt;

    auto type = cli.type;
    if (!type) type = targets.empty() ? ContentType::Other
                                      : targets.front().categories.type_for_category(*cli.category_id).value_or(ContentType::Other);

    // an explicit pair is what the first target gets, whatever its mapping says
    if (cli.category_id && !targets.empty()) targets.front().categories.set_category(*type, *cli.category_id, *cli.type_id);

    return type;
}

int SeedTools::upload(const CommandLine& cli) {
    auto targets = select_targets(cli.trackers);
    if (targets.empty()) SEEDTOOLS_LOG(log_, warning) << "No tracker selected, nothing will be submitted";

    auto release = scan_release(*cli.input);
    release.type_override = type_override(cli, targets);

    FfprobeProber prober(config_.paths.ffprobe, log_);
    ReleaseClassifier classifier(config_.policy.classification_threshold, &prober, log_);
    MetadataResolver resolver(identification_services(), config_.policy, log_);
    ToolchainArtifactBuilder artifacts(config_.paths, log_);
    auto client = seeding_client();

    std::vector<std::shared_ptr<BaseTracker>> trackers;
    for (const auto& t : targets) trackers.push_back(make_tracker(t, http_, config_.policy, log_));

    OrchestratorSettings settings{ config_.paths.torrent_dir, config_.paths.image_base_url };
    UploadOrchestrator orchestrator(config_.policy, classifier, resolver, std::move(trackers), artifacts, client.get(),
                                    settings, log_);

    auto job = orchestrator.run({ std::move(release), cli.preflight_only });
    UploadOrchestrator::report(job, std::cout);

    auto overall = job.overall();
    bool clean = overall == OverallOutcome::Succeeded || overall == OverallOutcome::Skipped;
    return clean && !job.fatal_error ? 0 : 1;
}

int SeedTools::sync(const CommandLine& cli) {
    auto targets = select_targets(cli.trackers);

    auto client = seeding_client();
    if (!client) throw ConfigError("sync needs a qbittorrent client");

    std::vector<std::shared_ptr<BaseTracker>> trackers;
    for (const auto& t : targets) trackers.push_back(make_tracker(t, http_, config_.policy, log_));

    CrossSeedSync sync(config_.policy, *client, std::move(trackers), log_);
    auto report = sync.run();
    CrossSeedSync::report(report, std::cout);
    return 0;
}

std::vector<std::shared_ptr<IdentificationService>> SeedTools::identification_services() {
    const auto& services = config_.services;
    const auto& policy = config_.policy;

    std::vector<std::shared_ptr<IdentificationService>> list;

    if (services.tmdb_api_key) {
        list.push_back(std::make_shared<TmdbService>(http_, ServiceEndpoint{ services.tmdb_url, policy.identification_timeout, policy.retry },
                                                     *services.tmdb_api_key, policy.acceptance_threshold, log_));
    } else {
        SEEDTOOLS_LOG(log_, warning) << "No TMDB API key configured, movies will not be identified";
    }

    if (services.tvmaze)
        list.push_back(std::make_shared<TvMazeService>(http_, ServiceEndpoint{ services.tvmaze_url, policy.identification_timeout, policy.retry }, log_));

    if (services.open_library)
        list.push_back(std::make_shared<OpenLibraryService>(
            http_, ServiceEndpoint{ services.open_library_url, policy.identification_timeout, policy.retry }, log_));

    return list;
}

std::unique_ptr<SeedingClient> SeedTools::seeding_client() {
    if (config_.qbittorrent.empty()) return nullptr;
    if (config_.qbittorrent.size() > 1)
        SEEDTOOLS_LOG(log_, info) << "Several qbittorrent clients configured, using " << config_.qbittorrent.front().webui_url;

    return std::make_unique<QBittorrentClient>(http_, config_.qbittorrent.front(), config_.policy.retry, log_);
}
