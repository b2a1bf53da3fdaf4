#pragma once

#include <mutex>
#include <string>

#include <Config.hpp>
#include <HttpClient.hpp>
#include <SeedingClient.hpp>

// qBittorrent WebUI API v2 with cookie (SID) authentication
class QBittorrentClient : public SeedingClient {
public:
    QBittorrentClient(HttpTransport& transport, QbittorrentConfig config, RetryPolicy retry, Logger& log)
        : transport_(transport), config_(std::move(config)), retry_(retry), log_(log) {}

    std::string name() const override { return "qBittorrent at " + config_.webui_url; }

    std::vector<SeedingEntry> list_completed() override;

    void add_torrent(const std::string& torrent_bytes, const std::string& file_name,
                     const AddTorrentOptions& options) override;

    const QbittorrentConfig& config() const { return config_; }

private:
    void login();
    std::string cookie();
    HttpResponse query(const std::string& path, const std::string& what);

    HttpTransport& transport_;
    QbittorrentConfig config_;
    RetryPolicy retry_;
    Logger& log_;

    std::mutex session_mutex_;
    std::string sid_;
};

// torrents/files names carry the torrent's root folder for multi-file torrents
TorrentFingerprint fingerprint_from_listing(const std::string& hash_hex, const std::string& name,
                                            const std::vector<TorrentFile>& listed_files);
