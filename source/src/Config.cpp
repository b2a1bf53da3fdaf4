#include <Config.hpp>
#include <Errors.hpp>
#include <Utils.hpp>

#include <fstream>
#include <sstream>
#include <set>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <typename T>
T value_or(const json& j, const char* key, T fallback, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    try {
        return j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(where + "." + key + ": " + e.what());
    }
}

template <typename T>
std::optional<T> optional_value(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return value_or<T>(j, key, T{}, where);
}

std::string required_string(const json& j, const char* key, const std::string& where) {
    auto value = value_or<std::string>(j, key, {}, where);
    if (value.empty()) throw ConfigError(where + "." + key + " is required");
    return value;
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    if (!root.contains(key)) return empty;
    const auto& s = root.at(key);
    if (!s.is_object()) throw ConfigError(std::string(key) + " must be an object");
    return s;
}

double unit_interval(const json& j, const char* key, double fallback, const std::string& where) {
    auto value = value_or<double>(j, key, fallback, where);
    if (value < 0.0 || value > 1.0) throw ConfigError(where + "." + key + " must be between 0 and 1");
    return value;
}

unsigned positive_id(const json& j, const std::string& where) {
    if (!j.is_number_integer()) throw ConfigError(where + " must be an integer");
    auto value = j.get<long long>();
    if (value <= 0) throw ConfigError(where + " must be positive");
    return static_cast<unsigned>(value);
}

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

LoggingConfig parse_logging(const json& j) {
    LoggingConfig config;
    config.level = value_or<std::string>(j, "level", config.level, "logging");
    config.console = value_or<bool>(j, "console", config.console, "logging");
    config.file = optional_value<std::string>(j, "file", "logging");

    parse_severity(config.level);  // validates
    return config;
}

PathsConfig parse_paths(const json& j) {
    PathsConfig paths;
    paths.torrent_dir = value_or<std::string>(j, "torrent_dir", paths.torrent_dir.string(), "paths");
    paths.screenshots_dir = value_or<std::string>(j, "screenshots_dir", paths.screenshots_dir.string(), "paths");
    paths.ffprobe = value_or<std::string>(j, "ffprobe", paths.ffprobe, "paths");
    paths.ffmpeg = value_or<std::string>(j, "ffmpeg", paths.ffmpeg, "paths");
    paths.mediainfo = value_or<std::string>(j, "mediainfo", paths.mediainfo, "paths");
    paths.screenshot_count = value_or<unsigned>(j, "screenshot_count", paths.screenshot_count, "paths");
    if (auto base = optional_value<std::string>(j, "image_base_url", "paths")) paths.image_base_url = strip_trailing_slash(*base);
    return paths;
}

Policy parse_policy(const json& j) {
    Policy policy;
    policy.classification_threshold = unit_interval(j, "classification_threshold", policy.classification_threshold, "policy");
    policy.acceptance_threshold = unit_interval(j, "acceptance_threshold", policy.acceptance_threshold, "policy");
    policy.file_layout_score = unit_interval(j, "file_layout_score", policy.file_layout_score, "policy");
    policy.cross_seed_action_threshold = unit_interval(j, "cross_seed_action_threshold", policy.cross_seed_action_threshold, "policy");

    policy.max_concurrency = value_or<unsigned>(j, "max_concurrency", policy.max_concurrency, "policy");
    if (policy.max_concurrency == 0) throw ConfigError("policy.max_concurrency must be at least 1");

    auto ident_ms = value_or<long long>(j, "identification_timeout_ms", policy.identification_timeout.count(), "policy");
    auto submit_ms = value_or<long long>(j, "submission_timeout_ms", policy.submission_timeout.count(), "policy");
    if (ident_ms <= 0 || submit_ms <= 0) throw ConfigError("policy timeouts must be positive");
    policy.identification_timeout = std::chrono::milliseconds(ident_ms);
    policy.submission_timeout = std::chrono::milliseconds(submit_ms);

    const auto& retry = section(j, "retry");
    policy.retry.attempts = value_or<unsigned>(retry, "attempts", policy.retry.attempts, "policy.retry");
    policy.retry.multiplier = value_or<double>(retry, "multiplier", policy.retry.multiplier, "policy.retry");
    auto initial_ms = value_or<long long>(retry, "initial_backoff_ms", policy.retry.initial_backoff.count(), "policy.retry");
    auto max_ms = value_or<long long>(retry, "max_backoff_ms", policy.retry.max_backoff.count(), "policy.retry");

    if (policy.retry.attempts == 0) throw ConfigError("policy.retry.attempts must be at least 1");
    if (policy.retry.multiplier < 1.0) throw ConfigError("policy.retry.multiplier must be at least 1");
    if (initial_ms < 0 || max_ms < initial_ms) throw ConfigError("policy.retry backoff bounds are inconsistent");
    policy.retry.initial_backoff = std::chrono::milliseconds(initial_ms);
    policy.retry.max_backoff = std::chrono::milliseconds(max_ms);

    return policy;
}

ServicesConfig parse_services(const json& j) {
    ServicesConfig services;
    services.tmdb_api_key = optional_value<std::string>(j, "tmdb_api_key", "services");
    if (services.tmdb_api_key && services.tmdb_api_key->empty()) services.tmdb_api_key.reset();
    services.tmdb_url = strip_trailing_slash(value_or<std::string>(j, "tmdb_url", services.tmdb_url, "services"));
    services.tvmaze = value_or<bool>(j, "tvmaze", services.tvmaze, "services");
    services.tvmaze_url = strip_trailing_slash(value_or<std::string>(j, "tvmaze_url", services.tvmaze_url, "services"));
    services.open_library = value_or<bool>(j, "open_library", services.open_library, "services");
    services.open_library_url = strip_trailing_slash(value_or<std::string>(j, "open_library_url", services.open_library_url, "services"));
    return services;
}

QbittorrentConfig parse_qbittorrent(const json& j, const std::string& where) {
    if (!j.is_object()) throw ConfigError(where + " must be an object");

    QbittorrentConfig qb;
    qb.webui_url = strip_trailing_slash(required_string(j, "webui_url", where));
    qb.username = value_or<std::string>(j, "username", {}, where);
    qb.password = value_or<std::string>(j, "password", {}, where);
    qb.category = optional_value<std::string>(j, "category", where);
    qb.default_save_path = value_or<std::string>(j, "default_save_path", {}, where);
    return qb;
}

CategoryMapping parse_categories(const json& tracker, TrackerKind kind, const std::string& where) {
    CategoryMapping mapping;

    const auto& categories = section(tracker, "categories");
    for (const auto& [key, entry] : categories.items()) {
        auto type = content_type_from_name(key);
        if (!type || content_type_name(*type) != key)
            throw ConfigError(where + ".categories: unknown content type '" + key + "'");

        auto entry_where = where + ".categories." + key;
        if (!entry.is_object() || !entry.contains("category_id"))
            throw ConfigError(entry_where + " needs a category_id");

        auto category_id = positive_id(entry.at("category_id"), entry_where + ".category_id");

        unsigned type_id = 0;
        if (entry.contains("type_id")) type_id = positive_id(entry.at("type_id"), entry_where + ".type_id");
        else if (kind == TrackerKind::Unit3d) throw ConfigError(entry_where + " needs a type_id");

        mapping.set_category(*type, category_id, type_id);
    }

    const auto& resolutions = section(tracker, "resolutions");
    for (const auto& [tag, id] : resolutions.items()) {
        mapping.set_resolution(to_lower(tag), positive_id(id, where + ".resolutions." + tag));
    }

    return mapping;
}

TrackerTarget parse_tracker(const json& j, const std::string& where) {
    if (!j.is_object()) throw ConfigError(where + " must be an object");

    TrackerTarget target;
    target.name = required_string(j, "name", where);

    auto tracker_where = "trackers." + target.name;
    auto kind = to_lower(required_string(j, "kind", tracker_where));
    if (kind == "unit3d") target.kind = TrackerKind::Unit3d;
    else if (kind == "torrentleech") target.kind = TrackerKind::TorrentLeech;
    else throw ConfigError(tracker_where + ".kind must be 'unit3d' or 'torrentleech'");

    target.enabled = value_or<bool>(j, "enabled", true, tracker_where);
    target.announce_url = required_string(j, "announce_url", tracker_where);
    target.api_key = value_or<std::string>(j, "api_key", {}, tracker_where);
    if (target.enabled && target.api_key.empty()) throw ConfigError(tracker_where + ".api_key is required");

    if (target.kind == TrackerKind::Unit3d) {
        target.base_url = strip_trailing_slash(required_string(j, "base_url", tracker_where));
        target.upload_url = value_or<std::string>(j, "upload_url", target.base_url + "/api/torrents/upload", tracker_where);
        target.search_url = value_or<std::string>(j, "search_url", target.base_url + "/api/torrents/filter", tracker_where);
    } else {
        target.base_url = strip_trailing_slash(value_or<std::string>(j, "base_url", "https://www.torrentleech.org", tracker_where));
        target.upload_url = value_or<std::string>(j, "upload_url", target.base_url + "/torrents/upload/apiupload", tracker_where);
        target.search_url = value_or<std::string>(j, "search_url", target.base_url + "/api/torrentsearch", tracker_where);
    }

    target.source = value_or<std::string>(j, "source", target.name, tracker_where);
    target.is_private = value_or<bool>(j, "private", true, tracker_where);
    target.anonymous = value_or<bool>(j, "anonymous", false, tracker_where);
    target.custom_description = optional_value<std::string>(j, "custom_description", tracker_where);
    target.inject_after_upload = value_or<bool>(j, "inject_after_upload", false, tracker_where);
    target.cross_seed_duplicates = value_or<bool>(j, "cross_seed_duplicates", false, tracker_where);

    target.categories = parse_categories(j, target.kind, tracker_where);

    return target;
}

}

void CategoryMapping::set_category(ContentType type, unsigned category_id, unsigned type_id) {
    categories_[type] = { category_id, type_id };
}

void CategoryMapping::set_resolution(const std::string& tag, unsigned resolution_id) {
    resolutions_[tag] = resolution_id;
}

std::optional<CategoryAssignment> CategoryMapping::assignment_for(ContentType type, const std::optional<std::string>& resolution) const {
    auto it = categories_.find(type);
    if (it == categories_.end()) return std::nullopt;

    CategoryAssignment assignment{ it->second.first, it->second.second, std::nullopt };

    if (resolution) {
        auto res = resolutions_.find(to_lower(*resolution));
        if (res != resolutions_.end()) assignment.resolution_id = res->second;
    }
    if (!assignment.resolution_id) {
        auto fallback = resolutions_.find("other");
        if (fallback != resolutions_.end()) assignment.resolution_id = fallback->second;
    }

    return assignment;
}

std::optional<ContentType> CategoryMapping::type_for_category(unsigned category_id) const {
    for (const auto& [type, ids] : categories_) {
        if (ids.first == category_id) return type;
    }
    return std::nullopt;
}

const TrackerTarget* AppConfig::find_tracker(const std::string& name) const {
    for (const auto& t : trackers) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

AppConfig parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed JSON: ") + e.what());
    }
    if (!root.is_object()) throw ConfigError("top level must be an object");

    AppConfig config;
    config.logging = parse_logging(section(root, "logging"));
    config.paths = parse_paths(section(root, "paths"));
    config.policy = parse_policy(section(root, "policy"));
    config.services = parse_services(section(root, "services"));

    if (root.contains("qbittorrent")) {
        const auto& list = root.at("qbittorrent");
        if (!list.is_array()) throw ConfigError("qbittorrent must be a list");
        for (size_t i = 0; i < list.size(); ++i) {
            config.qbittorrent.push_back(parse_qbittorrent(list.at(i), "qbittorrent[" + std::to_string(i) + "]"));
        }
    }

    if (root.contains("trackers")) {
        const auto& list = root.at("trackers");
        if (!list.is_array()) throw ConfigError("trackers must be a list");

        std::set<std::string> names;
        for (size_t i = 0; i < list.size(); ++i) {
            auto target = parse_tracker(list.at(i), "trackers[" + std::to_string(i) + "]");
            if (!names.insert(target.name).second) throw ConfigError("duplicate tracker name '" + target.name + "'");
            config.trackers.push_back(std::move(target));
        }
    }

    return config;
}

AppConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw ConfigError("cannot open " + path.string());

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}
