#include <QBittorrentClient.hpp>
#include <Errors.hpp>
#include <Utils.hpp>

#include <algorithm>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TorrentFingerprint fingerprint_from_listing(const std::string& hash_hex, const std::string& name,
                                            const std::vector<TorrentFile>& listed_files) {
    TorrentFingerprint fp;
    auto hash = info_hash_from_hex(hash_hex);
    if (!hash) throw ServiceError("invalid info hash '" + hash_hex + "'");
    fp.info_hash = *hash;
    fp.name = name;

    // strip the root folder so paths are relative to the torrent root like in the info dict
    std::optional<std::string> root;
    if (!listed_files.empty()) {
        auto first_slash = listed_files.front().path.find('/');
        if (first_slash != std::string::npos) {
            auto candidate = listed_files.front().path.substr(0, first_slash + 1);
            bool shared = std::all_of(listed_files.begin(), listed_files.end(),
                                      [&](const auto& f) { return f.path.rfind(candidate, 0) == 0; });
            if (shared) root = candidate;
        }
    }

    fp.multi_file = root.has_value();
    for (const auto& f : listed_files) {
        fp.files.push_back({ root ? f.path.substr(root->size()) : f.path, f.length });
        fp.total_size += f.length;
    }

    return fp;
}

void QBittorrentClient::login() {
    HttpRequest req;
    req.method = http::verb::post;
    req.url = config_.webui_url + "/api/v2/auth/login";
    req.content_type = "application/x-www-form-urlencoded";
    req.body = form_encode({ { "username", config_.username }, { "password", config_.password } });
    req.headers.emplace_back("Referer", config_.webui_url);

    auto res = transport_.send(req);
    ensure_success(res, "qBittorrent login");

    if (trim(res.body) != "Ok.") throw ServiceError("qBittorrent login rejected for user '" + config_.username + "'");

    std::string sid;
    for (const auto& set_cookie : res.headers_named("Set-Cookie")) {
        if (set_cookie.rfind("SID=", 0) == 0) sid = set_cookie.substr(0, set_cookie.find(';'));
    }
    if (sid.empty()) throw ServiceError("qBittorrent login returned no session cookie");

    std::scoped_lock<std::mutex> lock(session_mutex_);
    sid_ = sid;
    SEEDTOOLS_LOG(log_, info) << "Logged in to " << name();
}

std::string QBittorrentClient::cookie() {
    {
        std::scoped_lock<std::mutex> lock(session_mutex_);
        if (!sid_.empty()) return sid_;
    }
    login();
    std::scoped_lock<std::mutex> lock(session_mutex_);
    return sid_;
}

HttpResponse QBittorrentClient::query(const std::string& path, const std::string& what) {
    return with_retry(retry_, log_, what, [&] {
        HttpRequest req;
        req.url = config_.webui_url + path;
        req.headers.emplace_back("Cookie", cookie());

        auto res = transport_.send(req);
        if (res.status == 403) {
            // session expired; log in again once
            {
                std::scoped_lock<std::mutex> lock(session_mutex_);
                sid_.clear();
            }
            req.headers.back().second = cookie();
            res = transport_.send(req);
        }
        ensure_success(res, what);
        return res;
    });
}

std::vector<SeedingEntry> QBittorrentClient::list_completed() {
    auto info = query("/api/v2/torrents/info?filter=completed", "qBittorrent torrent list");

    std::vector<SeedingEntry> entries;
    try {
        auto torrents = json::parse(info.body);
        for (const auto& t : torrents) {
            if (t.value("progress", 0.0) < 1.0) continue;

            auto hash = t.at("hash").get<std::string>();
            auto name = t.at("name").get<std::string>();

            auto files_res = query("/api/v2/torrents/files?" + form_encode({ { "hash", hash } }), "qBittorrent file list");

            std::vector<TorrentFile> files;
            for (const auto& f : json::parse(files_res.body)) {
                files.push_back({ f.at("name").get<std::string>(), f.at("size").get<uint64_t>() });
            }

            try {
                entries.push_back({ fingerprint_from_listing(hash, name, files),
                                    t.value("save_path", config_.default_save_path),
                                    t.value("category", std::string{}) });
            } catch (const ServiceError& e) {
                SEEDTOOLS_LOG(log_, warning) << "Skipping '" << name << "': " << e.what();
            }
        }
    } catch (const json::exception& e) {
        throw ServiceError(std::string("qBittorrent: malformed torrent list: ") + e.what());
    }

    SEEDTOOLS_LOG(log_, info) << name() << " seeds " << entries.size() << " completed torrent(s)";
    return entries;
}

void QBittorrentClient::add_torrent(const std::string& torrent_bytes, const std::string& file_name,
                                    const AddTorrentOptions& options) {
    MultipartForm form;
    form.add_file("torrents", file_name, torrent_bytes, "application/x-bittorrent");
    if (!options.save_path.empty()) form.add_field("savepath", options.save_path);

    auto category = options.category ? options.category : config_.category;
    if (category) form.add_field("category", *category);

    form.add_field("skip_checking", options.skip_checking ? "true" : "false");
    form.add_field("paused", options.paused ? "true" : "false");

    HttpRequest req;
    req.method = http::verb::post;
    req.url = config_.webui_url + "/api/v2/torrents/add";
    req.content_type = form.content_type();
    req.body = form.body();
    req.headers.emplace_back("Cookie", cookie());

    auto res = transport_.send(req);
    ensure_success(res, "qBittorrent add");
    if (trim(res.body) == "Fails.") throw ServiceError("qBittorrent refused " + file_name);

    SEEDTOOLS_LOG(log_, info) << "Added " << file_name << " to " << name()
                              << (options.save_path.empty() ? "" : " at " + options.save_path);
}
