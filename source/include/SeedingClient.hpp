#pragma once

#include <optional>
#include <string>
#include <vector>

#include <CrossSeedMatcher.hpp>

struct SeedingEntry {
    TorrentFingerprint fingerprint;
    std::string save_path;
    std::string category;
};

struct AddTorrentOptions {
    std::string save_path;
    std::optional<std::string> category;
    bool skip_checking = true;
    bool paused = false;
};

// the local torrent client: a snapshot of what it seeds, and a way to add more
class SeedingClient {
public:
    virtual ~SeedingClient() = default;

    virtual std::string name() const = 0;

    // completed torrents only; throws TransientNetworkError or ServiceError
    virtual std::vector<SeedingEntry> list_completed() = 0;

    virtual void add_torrent(const std::string& torrent_bytes, const std::string& file_name,
                             const AddTorrentOptions& options) = 0;
};
