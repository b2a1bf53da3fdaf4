#include <Unit3dTracker.hpp>
#include <Errors.hpp>

#include <cstdio>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string episode_tag(unsigned season, unsigned episode) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "S%02uE%02u", season, episode);
    return buf;
}

std::string id_or_zero(const std::optional<ResolvedIdentifier>& id) {
    return id ? id->value : "0";
}

}

std::vector<CatalogHit> Unit3dTracker::filter(const std::vector<std::pair<std::string, std::string>>& params, const std::string& what) {
    HttpRequest req;
    req.url = target_.search_url + "?" + form_encode(params);
    req.timeout = policy_.identification_timeout;
    req.headers.emplace_back("Accept", "application/json");

    auto res = exchange(req, what, true);
    if (!res.ok()) fail(res, what);

    std::vector<CatalogHit> hits;
    try {
        auto body = json::parse(res.body);
        if (!body.contains("data") || !body["data"].is_array()) return hits;

        for (const auto& item : body["data"]) {
            if (!item.contains("attributes")) continue;
            const auto& attr = item["attributes"];

            CatalogHit hit;
            if (item.contains("id")) hit.id = item["id"].is_string() ? item["id"].get<std::string>() : item["id"].dump();
            hit.name = attr.value("name", std::string{});
            if (attr.contains("size") && attr["size"].is_number()) hit.size = attr["size"].get<uint64_t>();
            if (attr.contains("info_hash") && attr["info_hash"].is_string()) hit.info_hash = to_lower(attr["info_hash"].get<std::string>());
            if (attr.contains("download_link") && attr["download_link"].is_string()) hit.download_link = attr["download_link"].get<std::string>();
            hits.push_back(std::move(hit));
        }
    } catch (const json::exception& e) {
        throw TargetError(name(), what + ": malformed response: " + e.what());
    }

    return hits;
}

PreflightResult Unit3dTracker::preflight(const PreflightQuery& query) {
    std::vector<std::pair<std::string, std::string>> params{
        { "name", query.release_name },
        { "perPage", "10" },
        { "sortField", "name" },
        { "sortDirection", "asc" },
        { "api_token", target_.api_key },
    };

    bool episode = query.type == ContentType::TVShow && query.parsed.season && query.parsed.episode;
    if (episode) {
        params.emplace_back("seasonNumber", std::to_string(*query.parsed.season));
        params.emplace_back("episodeNumber", std::to_string(*query.parsed.episode));
    }

    PreflightResult result;
    result.candidates = filter(params, "duplicate search");

    for (const auto& hit : result.candidates) {
        // the name filter is a substring match; an episode only collides with the same episode
        if (episode && hit.name.find(episode_tag(*query.parsed.season, *query.parsed.episode)) == std::string::npos) continue;

        result.duplicate = true;
        result.reason = "duplicate of '" + hit.name + "'";
        SEEDTOOLS_LOG(log_, info) << name() << ": " << query.release_name << " is a " << result.reason;
        break;
    }

    return result;
}

std::vector<CatalogHit> Unit3dTracker::search(const std::string& query, std::optional<uint64_t> size) {
    auto hits = filter({ { "name", query },
                         { "perPage", "25" },
                         { "api_token", target_.api_key } },
                       "catalog search");

    if (size) std::erase_if(hits, [&](const CatalogHit& h) { return h.size != *size; });
    return hits;
}

std::string Unit3dTracker::download(const CatalogHit& hit) {
    if (!hit.download_link) throw TargetError(name(), "'" + hit.name + "' has no download link");

    HttpRequest req;
    req.url = *hit.download_link;
    req.timeout = policy_.identification_timeout;

    auto res = exchange(req, "torrent download", true);
    if (!res.ok()) fail(res, "torrent download");
    return res.body;
}

SubmitResult Unit3dTracker::submit(const UploadPayload& payload, const CategoryAssignment& assignment) {
    MultipartForm form;
    form.add_file("torrent", payload.release_name + ".torrent", payload.torrent, "application/x-bittorrent");
    form.add_field("name", payload.release_name);
    form.add_field("category_id", std::to_string(assignment.category_id));
    form.add_field("type_id", std::to_string(assignment.type_id));
    form.add_field("resolution_id", std::to_string(assignment.resolution_id.value_or(0)));
    form.add_field("anonymous", target_.anonymous ? "1" : "0");
    form.add_field("description", payload.description);
    form.add_field("mediainfo", payload.mediainfo);
    if (payload.nfo) form.add_file("nfo", payload.release_name + ".nfo", *payload.nfo, "text/plain");

    form.add_field("tmdb", id_or_zero(payload.identities.tmdb));
    form.add_field("imdb", payload.identities.imdb ? imdb_digits(payload.identities.imdb->value) : "0");
    form.add_field("tvdb", id_or_zero(payload.identities.tvdb));
    form.add_field("mal", "0");
    form.add_field("igdb", "0");
    form.add_field("stream", "0");
    form.add_field("sd", "0");

    if (payload.type == ContentType::TVShow || payload.type == ContentType::Boxset) {
        if (payload.parsed.season) form.add_field("season_number", std::to_string(*payload.parsed.season));
        if (payload.parsed.episode) form.add_field("episode_number", std::to_string(*payload.parsed.episode));
    }

    HttpRequest req;
    req.method = http::verb::post;
    req.url = target_.upload_url;
    req.timeout = policy_.submission_timeout;
    req.content_type = form.content_type();
    req.body = form.body();
    req.headers.emplace_back("Authorization", "Bearer " + target_.api_key);
    req.headers.emplace_back("Accept", "application/json");

    auto res = exchange(req, "upload", false);
    if (!res.ok()) fail(res, "upload");

    SubmitResult result;
    auto body = json::parse(res.body, nullptr, false);
    if (body.is_discarded() || !body.is_object())
        throw TargetError(name(), "upload returned an unreadable response", res.status);

    if (body.contains("success") && body["success"].is_boolean() && !body["success"].get<bool>())
        fail(res, "upload");

    try {
        result.message = body.contains("message") && body["message"].is_string() ? body["message"].get<std::string>() : "uploaded";
        if (body.contains("data") && body["data"].is_string()) result.download_link = body["data"].get<std::string>();
        if (body.contains("data") && body["data"].is_object() && body["data"].contains("id"))
            result.torrent_id = body["data"]["id"].dump();
    } catch (const json::exception& e) {
        throw TargetError(name(), std::string("upload returned an unreadable response: ") + e.what(), res.status);
    }

    SEEDTOOLS_LOG(log_, info) << name() << ": uploaded " << payload.release_name;
    return result;
}
