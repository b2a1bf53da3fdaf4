#pragma once

#include <string>
#include <vector>

#include <Logging.hpp>
#include <TorrentFile.hpp>

// the shape shared by a local seeding entry and a decoded catalog torrent
struct TorrentFingerprint {
    InfoHash info_hash{};
    std::string name;
    std::vector<TorrentFile> files;     // paths relative to the torrent root
    uint64_t total_size{};
    bool multi_file{};
};

TorrentFingerprint fingerprint_of(const TorrentMetadata& meta);

enum class MatchKind { Exact, FileLayout };

std::string match_kind_name(MatchKind kind);

struct CrossSeedCandidate {
    InfoHash local_hash{};
    InfoHash remote_hash{};
    std::string local_name;
    std::string remote_name;
    double score{};
    MatchKind kind = MatchKind::Exact;
    std::string rationale;
    bool container_differs{};   // one side is a single file, the other a folder

    bool heuristic() const { return kind == MatchKind::FileLayout; }
};

// Pairs local entries with catalog entries. Equal info-hash is an Exact match (1.0);
// otherwise equal total size and equal (path, length) multisets make a FileLayout match.
// The result is sorted by (local hash, remote hash) and holds each pair once, so it
// does not depend on the order of either input.
class CrossSeedMatcher {
public:
    CrossSeedMatcher(double file_layout_score, Logger& log) : file_layout_score_(file_layout_score), log_(log) {}

    std::vector<CrossSeedCandidate> match(const std::vector<TorrentFingerprint>& local,
                                          const std::vector<TorrentFingerprint>& remote) const;

    std::vector<CrossSeedCandidate> match(const std::vector<TorrentMetadata>& local,
                                          const std::vector<TorrentMetadata>& remote) const;

private:
    double file_layout_score_;
    Logger& log_;
};

struct CatalogBlob {
    std::string origin;     // where it came from (download link, file name)
    std::string bytes;
};

struct CatalogEntry {
    TorrentFingerprint fingerprint;
    std::string origin;
    std::string bytes;
};

// Decodes a batch of catalog torrents. Malformed blobs are logged and skipped.
// Entries carry the hash of the info dictionary as it was sent, which is what
// the tracker and every client know the torrent by.
std::vector<CatalogEntry> decode_catalog(const std::vector<CatalogBlob>& blobs, Logger& log);
