#include <UploadOrchestrator.hpp>
#include <Concurrency.hpp>
#include <CrossSeedMatcher.hpp>
#include <Description.hpp>
#include <Errors.hpp>

#include <algorithm>

namespace {

std::string upload_name(const UploadJob& job) {
    return job.parsed.release_name.empty() ? job.release_name() : job.parsed.release_name;
}

std::optional<std::string> source_tag(const TrackerTarget& target) {
    if (target.source.empty()) return std::nullopt;
    return target.source;
}

}

TorrentFingerprint fingerprint_of(const Release& release) {
    TorrentFingerprint fp;
    fp.name = release.name;
    fp.multi_file = !release.single_file;
    for (const auto& f : release.files) fp.files.push_back({ f.path, f.size });
    fp.total_size = release.total_size;
    return fp;
}

UploadJob UploadOrchestrator::run(const UploadRequest& request) const {
    const auto& release = request.release;

    std::vector<std::string> names;
    for (const auto& t : targets_) names.push_back(t->name());
    UploadJob job(release.name, names);

    try {
        auto type = classify(release);
        job.type = type;
        job.parsed = parse_release_name(release.name, type);

        if (type == ContentType::MusicAlbum || type == ContentType::Other) {
            job.advance(JobState::Preflight);
        } else {
            job.advance(JobState::Resolving);
            job.identities = resolver_.resolve(release, type, job.parsed);
            job.advance(JobState::Preflight);
        }
    } catch (const ClassificationError& e) {
        SEEDTOOLS_LOG(log_, error) << e.what();
        job.fail(e.what());
        return job;
    } catch (const ResolutionError& e) {
        SEEDTOOLS_LOG(log_, error) << release.name << ": " << e.what();
        job.fail(e.what());
        return job;
    }

    preflight(job, release);

    if (request.preflight_only) {
        for (const auto& name : job.pending_targets()) job.outcome(name) = TargetOutcome::skipped("preflight only, no duplicate");
        job.advance(JobState::Done);
        return job;
    }

    if (job.terminal()) {
        SEEDTOOLS_LOG(log_, info) << release.name << ": no target left after preflight, nothing to build";
        job.advance(JobState::Done);
        return job;
    }

    build_and_submit(job, release);
    return job;
}

ContentType UploadOrchestrator::classify(const Release& release) const {
    auto classification = classifier_.classify(release);
    if (classification.ambiguous())
        throw ClassificationError(release.name + ": cannot tell the content type (" + classification.signal
                                  + "), pass --type or --category-id");
    return *classification.type;
}

void UploadOrchestrator::preflight(UploadJob& job, const Release& release) const {
    auto type = *job.type;

    std::vector<BaseTracker*> checked;
    for (const auto& t : targets_) {
        if (!t->target().categories.supports(type)) {
            job.outcome(t->name()) = TargetOutcome::skipped("unsupported content type " + content_type_name(type));
            continue;
        }
        checked.push_back(t.get());
    }

    PreflightQuery query{ upload_name(job), job.parsed, type, job.identities, release.total_size };

    auto outcomes = fan_out(checked.size(), policy_.max_concurrency, [&](size_t i) -> TargetOutcome {
        auto& target = *checked[i];
        try {
            auto result = target.preflight(query);
            if (!result.duplicate) return {};

            auto outcome = TargetOutcome::skipped(result.reason.empty() ? "duplicate" : result.reason);
            if (target.target().cross_seed_duplicates && cross_seed_duplicate(target, result, release))
                outcome.reason += ", cross-seeded";
            return outcome;
        } catch (const TargetError& e) {
            if (e.status() == 409u) return TargetOutcome::skipped("duplicate (HTTP 409)");
            return TargetOutcome::failed(e.what(), e.status());
        } catch (const std::exception& e) {
            return TargetOutcome::failed(target.name() + ": " + e.what());
        }
    });

    for (size_t i = 0; i < checked.size(); ++i) {
        job.outcome(checked[i]->name()) = outcomes[i];
        SEEDTOOLS_LOG(log_, info) << checked[i]->name() << " preflight: "
                                  << (outcomes[i].terminal() ? outcome_kind_name(outcomes[i].kind) + " (" + outcomes[i].reason + ")" : "clear");
    }
}

bool UploadOrchestrator::cross_seed_duplicate(BaseTracker& target, const PreflightResult& result, const Release& release) const {
    if (!client_) return false;

    std::vector<CatalogBlob> blobs;
    for (const auto& hit : result.candidates) {
        if (!hit.download_link || (hit.size != 0 && hit.size != release.total_size)) continue;
        try {
            blobs.push_back({ *hit.download_link, target.download(hit) });
        } catch (const TargetError& e) {
            SEEDTOOLS_LOG(log_, warning) << "Cross-seed download failed: " << e.what();
        }
    }

    auto catalog = decode_catalog(blobs, log_);
    std::vector<TorrentFingerprint> remote;
    for (const auto& entry : catalog) remote.push_back(entry.fingerprint);

    CrossSeedMatcher matcher(policy_.file_layout_score, log_);
    for (const auto& candidate : matcher.match({ fingerprint_of(release) }, remote)) {
        // the client finds the data under save_path/<torrent name>, so the names have to agree
        if (candidate.score < policy_.cross_seed_action_threshold || candidate.container_differs
            || candidate.remote_name != release.name)
            continue;

        auto entry = std::find_if(catalog.begin(), catalog.end(),
                                  [&](const auto& e) { return e.fingerprint.info_hash == candidate.remote_hash; });
        if (entry == catalog.end()) continue;

        try {
            inject(entry->bytes, candidate.remote_name + ".torrent", release);
            SEEDTOOLS_LOG(log_, info) << "Cross-seeding " << candidate.remote_name << " from " << target.name();
            return true;
        } catch (const ServiceError& e) {
            SEEDTOOLS_LOG(log_, warning) << "Cross-seed add failed: " << e.what();
        } catch (const TransientNetworkError& e) {
            SEEDTOOLS_LOG(log_, warning) << "Cross-seed add failed: " << e.what();
        }
    }
    return false;
}

void UploadOrchestrator::inject(const std::string& torrent, const std::string& file_name, const Release& release) const {
    AddTorrentOptions options;
    options.save_path = std::filesystem::absolute(release.root).parent_path().string();
    client_->add_torrent(torrent, file_name, options);
}

void UploadOrchestrator::build_and_submit(UploadJob& job, const Release& release) const {
    job.advance(JobState::Building);
    auto type = *job.type;
    auto name = upload_name(job);

    std::vector<BaseTracker*> active;
    for (const auto& t : targets_) {
        if (!job.outcome(t->name()).terminal()) active.push_back(t.get());
    }

    MediaArtifacts media;
    TorrentMetadata base;
    try {
        media = artifacts_.build_media_artifacts(release, type);

        const auto& first = active.front()->target();
        TorrentOptions options;
        options.announce = first.announce_url;
        options.is_private = first.is_private;
        options.source = source_tag(first);
        base = artifacts_.build_torrent(release, options);
    } catch (const std::runtime_error& e) {
        SEEDTOOLS_LOG(log_, error) << release.name << ": building artifacts failed: " << e.what();
        job.fail(std::string("artifact build failed: ") + e.what());
        return;
    }

    std::optional<std::string> nfo;
    if (auto path = find_release_nfo(release)) {
        try {
            nfo = read_from_file(path->string());
        } catch (const std::runtime_error& e) {
            SEEDTOOLS_LOG(log_, warning) << release.name << ": skipping the nfo: " << e.what();
        }
    }

    DescriptionInput description;
    description.type = type;
    description.identities = job.identities;
    if (settings_.image_base_url) {
        for (const auto& shot : media.screenshots) description.screenshot_urls.push_back(published_url(*settings_.image_base_url, shot));
        if (media.sample) description.sample_url = published_url(*settings_.image_base_url, *media.sample);
    }

    std::vector<UploadPayload> payloads;
    for (auto* t : active) {
        const auto& target = t->target();

        UploadPayload payload;
        payload.release_name = name;
        payload.type = type;
        payload.parsed = job.parsed;
        payload.identities = job.identities;
        payload.torrent = encode_torrent(retarget(base, target.announce_url, target.is_private, source_tag(target)));
        payload.mediainfo = media.mediainfo;
        payload.nfo = nfo;

        auto per_target = description;
        per_target.custom_description = target.custom_description;
        payload.description = build_description(per_target);

        if (settings_.torrent_dir) {
            auto path = *settings_.torrent_dir / (name + "." + target.name + ".torrent");
            try {
                std::filesystem::create_directories(*settings_.torrent_dir);
                write_to_file(path.string(), payload.torrent);
            } catch (const std::runtime_error& e) {
                SEEDTOOLS_LOG(log_, warning) << "Could not keep a copy of the torrent: " << e.what();
            }
        }

        payloads.push_back(std::move(payload));
    }

    job.advance(JobState::Submitting);

    auto outcomes = fan_out(active.size(), policy_.max_concurrency, [&](size_t i) -> TargetOutcome {
        auto& target = *active[i];
        auto assignment = target.target().categories.assignment_for(type, job.parsed.resolution);
        if (!assignment) return TargetOutcome::failed(target.name() + ": no category for " + content_type_name(type));

        SubmitResult result;
        try {
            result = target.submit(payloads[i], *assignment);
        } catch (const TargetError& e) {
            return TargetOutcome::failed(e.what(), e.status());
        } catch (const std::exception& e) {
            return TargetOutcome::failed(target.name() + ": " + e.what());
        }

        auto detail = result.message;
        if (target.target().inject_after_upload && client_) {
            // the tracker may rewrite the torrent; seed its copy when it hands one back
            try {
                auto torrent = payloads[i].torrent;
                if (result.download_link) torrent = target.download({ {}, name, release.total_size, std::nullopt, result.download_link });
                inject(torrent, name + ".torrent", release);
                detail += ", seeding in " + client_->name();
            } catch (const std::exception& e) {
                SEEDTOOLS_LOG(log_, warning) << target.name() << ": uploaded but not added to the client: " << e.what();
                detail += ", not added to the client";
            }
        }
        return TargetOutcome::succeeded(detail);
    });

    for (size_t i = 0; i < active.size(); ++i) job.outcome(active[i]->name()) = outcomes[i];
    job.advance(JobState::Done);

    SEEDTOOLS_LOG(log_, info) << release.name << ": " << overall_outcome_name(job.overall());
}

void UploadOrchestrator::report(const UploadJob& job, std::ostream& out) {
    for (const auto& [name, outcome] : job.outcomes()) {
        out << "  " << name << ": " << outcome_kind_name(outcome.kind);
        if (!outcome.reason.empty()) out << " (" << outcome.reason << ")";
        if (outcome.status) out << " [HTTP " << *outcome.status << "]";
        out << "\n";
    }

    out << job.release_name() << ": " << overall_outcome_name(job.overall());
    if (job.fatal_error) out << ", " << *job.fatal_error;
    out << std::endl;
}
