#include <CrossSeedMatcher.hpp>

#include <algorithm>
#include <map>
#include <unordered_map>

namespace {

using LayoutKey = std::vector<std::pair<std::string, uint64_t>>;

LayoutKey layout_key(const TorrentFingerprint& fp) {
    LayoutKey key;
    key.reserve(fp.files.size());
    for (const auto& f : fp.files) key.emplace_back(f.path, f.length);
    std::sort(key.begin(), key.end());
    return key;
}

std::string layout_rationale(const TorrentFingerprint& local, const TorrentFingerprint& remote) {
    std::string rationale = "same " + std::to_string(local.files.size()) + "-file layout and total size "
                            + std::to_string(local.total_size) + " under a different info hash";
    if (local.name != remote.name) rationale += "; root name differs ('" + local.name + "' vs '" + remote.name + "')";
    if (local.multi_file != remote.multi_file)
        rationale += std::string("; ") + (local.multi_file ? "folder" : "single file") + " here, "
                     + (remote.multi_file ? "folder" : "single file") + " in the catalog";
    return rationale;
}

}

TorrentFingerprint fingerprint_of(const TorrentMetadata& meta) {
    return { info_hash(meta), meta.name, meta.files, meta.total_size, meta.multi_file };
}

std::string match_kind_name(MatchKind kind) {
    return kind == MatchKind::Exact ? "exact" : "file-layout";
}

std::vector<CrossSeedCandidate> CrossSeedMatcher::match(const std::vector<TorrentFingerprint>& local,
                                                        const std::vector<TorrentFingerprint>& remote) const {
    // bucket the catalog by total size; nothing of a different size is ever compared
    std::unordered_map<uint64_t, std::vector<const TorrentFingerprint*>> by_size;
    for (const auto& r : remote) by_size[r.total_size].push_back(&r);

    std::map<std::pair<InfoHash, InfoHash>, CrossSeedCandidate> found;
    std::map<const TorrentFingerprint*, LayoutKey> remote_keys;

    for (const auto& l : local) {
        auto bucket = by_size.find(l.total_size);
        if (bucket == by_size.end()) continue;

        std::optional<LayoutKey> local_key;

        for (const auto* r : bucket->second) {
            auto pair = std::make_pair(l.info_hash, r->info_hash);
            if (found.contains(pair)) continue;

            if (l.info_hash == r->info_hash) {
                found.emplace(pair, CrossSeedCandidate{ l.info_hash, r->info_hash, l.name, r->name, 1.0,
                                                        MatchKind::Exact, "identical info hash" });
                continue;
            }

            if (l.files.size() != r->files.size()) continue;

            if (!local_key) local_key = layout_key(l);
            auto key_it = remote_keys.find(r);
            if (key_it == remote_keys.end()) key_it = remote_keys.emplace(r, layout_key(*r)).first;

            if (*local_key == key_it->second) {
                found.emplace(pair, CrossSeedCandidate{ l.info_hash, r->info_hash, l.name, r->name, file_layout_score_,
                                                        MatchKind::FileLayout, layout_rationale(l, *r),
                                                        l.multi_file != r->multi_file });
            }
        }
    }

    std::vector<CrossSeedCandidate> out;
    out.reserve(found.size());
    for (auto& [pair, candidate] : found) out.push_back(std::move(candidate));

    SEEDTOOLS_LOG(log_, debug) << "Matched " << local.size() << " local against " << remote.size()
                               << " catalog torrents: " << out.size() << " candidate(s)";
    return out;
}

std::vector<CrossSeedCandidate> CrossSeedMatcher::match(const std::vector<TorrentMetadata>& local,
                                                        const std::vector<TorrentMetadata>& remote) const {
    std::vector<TorrentFingerprint> l, r;
    l.reserve(local.size());
    r.reserve(remote.size());
    for (const auto& m : local) l.push_back(fingerprint_of(m));
    for (const auto& m : remote) r.push_back(fingerprint_of(m));
    return match(l, r);
}

std::vector<CatalogEntry> decode_catalog(const std::vector<CatalogBlob>& blobs, Logger& log) {
    std::vector<CatalogEntry> entries;
    entries.reserve(blobs.size());

    for (const auto& blob : blobs) {
        try {
            auto meta = decode_torrent(blob.bytes);
            auto fp = fingerprint_of(meta);

            auto sent_hash = raw_info_hash(blob.bytes);
            if (sent_hash != fp.info_hash) {
                SEEDTOOLS_LOG(log, warning) << blob.origin << ": info dictionary is not canonically encoded, using hash "
                                            << to_hex(sent_hash) << " as sent";
                fp.info_hash = sent_hash;
            }

            entries.push_back({ std::move(fp), blob.origin, blob.bytes });
        } catch (const DecodeError& e) {
            SEEDTOOLS_LOG(log, warning) << "Skipping catalog torrent " << blob.origin << ": " << e.what();
        }
    }

    return entries;
}
