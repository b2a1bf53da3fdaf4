#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Logging.hpp>
#include <Release.hpp>
#include <Retry.hpp>

// Thresholds, scores and time limits. The defaults are the documented values.
struct Policy {
    double classification_threshold = 0.6;
    double acceptance_threshold = 0.75;         // identifier candidates below this are never resolved
    double file_layout_score = 0.8;             // score of a FileLayout cross-seed match
    double cross_seed_action_threshold = 0.8;   // sync adds FileLayout matches at or above this
    unsigned max_concurrency = 4;

    std::chrono::milliseconds identification_timeout{ 15000 };
    std::chrono::milliseconds submission_timeout{ 60000 };
    RetryPolicy retry;
};

struct PathsConfig {
    std::filesystem::path torrent_dir = "torrents";
    std::filesystem::path screenshots_dir = "screenshots";
    std::string ffprobe = "ffprobe";
    std::string ffmpeg = "ffmpeg";
    std::string mediainfo = "mediainfo";
    unsigned screenshot_count = 4;
    std::optional<std::string> image_base_url;  // where screenshots_dir is published; no screenshots in descriptions without it
};

struct ServicesConfig {
    std::optional<std::string> tmdb_api_key;
    std::string tmdb_url = "https://api.themoviedb.org/3";
    bool tvmaze = true;
    std::string tvmaze_url = "https://api.tvmaze.com";
    bool open_library = true;
    std::string open_library_url = "https://openlibrary.org";
};

struct QbittorrentConfig {
    std::string webui_url;
    std::string username;
    std::string password;
    std::optional<std::string> category;
    std::string default_save_path;
};

struct CategoryAssignment {
    unsigned category_id{};
    unsigned type_id{};
    std::optional<unsigned> resolution_id;

    bool operator==(const CategoryAssignment&) const = default;
};

// content type -> (category, type) and resolution tag -> resolution id, validated at load time
class CategoryMapping {
public:
    void set_category(ContentType type, unsigned category_id, unsigned type_id);
    void set_resolution(const std::string& tag, unsigned resolution_id);

    bool supports(ContentType type) const { return categories_.contains(type); }
    bool empty() const { return categories_.empty(); }

    std::optional<CategoryAssignment> assignment_for(ContentType type, const std::optional<std::string>& resolution) const;

    // first content type (in enum order) mapped to this category id
    std::optional<ContentType> type_for_category(unsigned category_id) const;

private:
    std::map<ContentType, std::pair<unsigned, unsigned>> categories_;
    std::map<std::string, unsigned> resolutions_;
};

enum class TrackerKind { Unit3d, TorrentLeech };

struct TrackerTarget {
    std::string name;
    TrackerKind kind = TrackerKind::Unit3d;
    bool enabled = true;

    std::string base_url;               // UNIT3D site root, or the TorrentLeech site
    std::string announce_url;
    std::string upload_url;             // defaults derived from base_url
    std::string search_url;
    std::string api_key;                // UNIT3D API token / TorrentLeech announce key

    std::string source;                 // info dict "source" tag
    bool is_private = true;
    bool anonymous = false;
    std::optional<std::string> custom_description;

    CategoryMapping categories;

    bool inject_after_upload = false;
    bool cross_seed_duplicates = false;
};

struct AppConfig {
    LoggingConfig logging;
    PathsConfig paths;
    Policy policy;
    ServicesConfig services;
    std::vector<QbittorrentConfig> qbittorrent;
    std::vector<TrackerTarget> trackers;

    const TrackerTarget* find_tracker(const std::string& name) const;
};

// throws ConfigError for unreadable files, malformed JSON and invalid values
AppConfig load_config(const std::filesystem::path& path);
AppConfig parse_config(const std::string& json_text);
