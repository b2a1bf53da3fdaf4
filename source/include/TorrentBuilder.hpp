#pragma once

#include <optional>
#include <string>

#include <Logging.hpp>
#include <Release.hpp>
#include <TorrentFile.hpp>

struct TorrentOptions {
    std::optional<uint64_t> piece_length;       // piece_length_for_size() when unset
    std::string announce;
    std::optional<bool> is_private;
    std::optional<std::string> source;
    std::optional<std::string> comment;
    std::string created_by = "seed-tools";
    bool stamp_creation_date = true;
};

// Hashes a release from disk into torrent metadata. Pieces run across file
// boundaries in file-list order, the same layout clients verify against.
class TorrentBuilder {
public:
    explicit TorrentBuilder(Logger& log) : log_(log) {}

    TorrentMetadata build(const Release& release, const TorrentOptions& options) const;

private:
    Logger& log_;
};

// copy of an already hashed torrent for another tracker: only announce, private and source differ
TorrentMetadata retarget(const TorrentMetadata& base, const std::string& announce,
                         std::optional<bool> is_private, const std::optional<std::string>& source);
