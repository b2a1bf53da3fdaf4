#include <CrossSeedSync.hpp>
#include <Concurrency.hpp>
#include <Errors.hpp>

#include <algorithm>
#include <iomanip>
#include <set>

size_t SyncReport::added() const {
    return std::count_if(candidates.begin(), candidates.end(), [](const auto& c) { return c.added; });
}

SyncReport CrossSeedSync::run() const {
    SyncReport report;

    auto snapshot = client_.list_completed();
    report.local_torrents = snapshot.size();
    SEEDTOOLS_LOG(log_, info) << "Syncing " << snapshot.size() << " torrent(s) from " << client_.name()
                              << " against " << trackers_.size() << " tracker(s)";

    for (const auto& tracker : trackers_) sync_tracker(*tracker, snapshot, report);
    return report;
}

void CrossSeedSync::sync_tracker(BaseTracker& tracker, const std::vector<SeedingEntry>& snapshot, SyncReport& report) const {
    struct Lookup {
        std::vector<CatalogHit> hits;
        bool failed{};
    };

    auto lookups = fan_out(snapshot.size(), policy_.max_concurrency, [&](size_t i) -> Lookup {
        const auto& fp = snapshot[i].fingerprint;
        try {
            return { tracker.search(fp.name, fp.total_size), false };
        } catch (const TargetError& e) {
            SEEDTOOLS_LOG(log_, warning) << "Search for '" << fp.name << "' failed: " << e.what();
            return { {}, true };
        }
    });

    // several local torrents can turn up the same catalog entry
    std::vector<CatalogHit> hits;
    std::set<std::string> seen;
    for (auto& lookup : lookups) {
        if (lookup.failed) ++report.failures;
        for (auto& hit : lookup.hits) {
            if (hit.download_link && seen.insert(*hit.download_link).second) hits.push_back(std::move(hit));
        }
    }

    struct Download {
        std::optional<CatalogBlob> blob;
    };

    auto downloads = fan_out(hits.size(), policy_.max_concurrency, [&](size_t i) -> Download {
        try {
            return { CatalogBlob{ *hits[i].download_link, tracker.download(hits[i]) } };
        } catch (const TargetError& e) {
            SEEDTOOLS_LOG(log_, warning) << "Download of '" << hits[i].name << "' failed: " << e.what();
            return {};
        }
    });

    std::vector<CatalogBlob> blobs;
    for (auto& d : downloads) {
        if (d.blob) blobs.push_back(std::move(*d.blob));
        else ++report.failures;
    }

    auto catalog = decode_catalog(blobs, log_);
    report.catalog_torrents += catalog.size();

    std::vector<TorrentFingerprint> local, remote;
    for (const auto& entry : snapshot) local.push_back(entry.fingerprint);
    for (const auto& entry : catalog) remote.push_back(entry.fingerprint);

    CrossSeedMatcher matcher(policy_.file_layout_score, log_);
    for (auto& candidate : matcher.match(local, remote)) {
        SyncCandidate result{ tracker.name(), candidate, false, {} };

        if (candidate.kind == MatchKind::Exact) {
            result.note = "already seeding";
        } else if (candidate.score < policy_.cross_seed_action_threshold) {
            result.note = "below action threshold";
        } else if (candidate.container_differs) {
            result.note = "file vs folder, not added";
        } else if (candidate.local_name != candidate.remote_name) {
            result.note = "root differs, not added";
        } else {
            auto entry = std::find_if(catalog.begin(), catalog.end(),
                                      [&](const auto& e) { return e.fingerprint.info_hash == candidate.remote_hash; });
            auto seeding = std::find_if(snapshot.begin(), snapshot.end(),
                                        [&](const auto& s) { return s.fingerprint.info_hash == candidate.local_hash; });

            AddTorrentOptions options;
            options.save_path = seeding->save_path;
            if (!seeding->category.empty()) options.category = seeding->category;

            try {
                client_.add_torrent(entry->bytes, candidate.remote_name + ".torrent", options);
                result.added = true;
                result.note = "added";
            } catch (const ServiceError& e) {
                SEEDTOOLS_LOG(log_, warning) << "Adding '" << candidate.remote_name << "' failed: " << e.what();
                result.note = std::string("add failed: ") + e.what();
            } catch (const TransientNetworkError& e) {
                SEEDTOOLS_LOG(log_, warning) << "Adding '" << candidate.remote_name << "' failed: " << e.what();
                result.note = std::string("add failed: ") + e.what();
            }
        }

        report.candidates.push_back(std::move(result));
    }
}

void CrossSeedSync::report(const SyncReport& report, std::ostream& out) {
    for (const auto& c : report.candidates) {
        out << c.tracker << ": " << c.candidate.local_name << " <-> " << c.candidate.remote_name
            << " [" << match_kind_name(c.candidate.kind) << " " << std::fixed << std::setprecision(2) << c.candidate.score << "] "
            << c.candidate.rationale << "; " << c.note << "\n";
    }

    out << report.candidates.size() << " candidate(s), " << report.added() << " added, from "
        << report.local_torrents << " local and " << report.catalog_torrents << " catalog torrent(s)";
    if (report.failures) out << ", " << report.failures << " lookup(s) failed";
    out << std::endl;
}
