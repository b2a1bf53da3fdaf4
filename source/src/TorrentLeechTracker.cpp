#include <TorrentLeechTracker.hpp>
#include <Errors.hpp>

#include <algorithm>
#include <cctype>

PreflightResult TorrentLeechTracker::preflight(const PreflightQuery& query) {
    HttpRequest req;
    req.method = http::verb::post;
    req.url = target_.search_url;
    req.timeout = policy_.identification_timeout;
    req.content_type = "application/x-www-form-urlencoded";
    req.body = form_encode({ { "announcekey", target_.api_key }, { "exact", "1" }, { "query", query.release_name } });

    auto res = exchange(req, "duplicate search", true);
    if (!res.ok()) fail(res, "duplicate search");

    // the answer is a bare count of exact-name matches
    auto body = trim(res.body);
    if (body.empty() || !std::all_of(body.begin(), body.end(), [](unsigned char c) { return std::isdigit(c); }))
        throw TargetError(name(), "duplicate search returned '" + body + "'", res.status);

    PreflightResult result;
    if (body.find_first_not_of('0') != std::string::npos) {
        result.duplicate = true;
        result.reason = "duplicate of '" + query.release_name + "'";
        SEEDTOOLS_LOG(log_, info) << name() << ": " << query.release_name << " already exists";
    }
    return result;
}

std::vector<CatalogHit> TorrentLeechTracker::search(const std::string& query, std::optional<uint64_t>) {
    SEEDTOOLS_LOG(log_, debug) << name() << ": no catalog search, skipping '" << query << "'";
    return {};
}

std::string TorrentLeechTracker::download(const CatalogHit& hit) {
    throw TargetError(name(), "cannot download '" + hit.name + "': no catalog access");
}

SubmitResult TorrentLeechTracker::submit(const UploadPayload& payload, const CategoryAssignment& assignment) {
    MultipartForm form;
    form.add_field("announcekey", target_.api_key);
    form.add_field("category", std::to_string(assignment.category_id));
    form.add_file("nfo", payload.release_name + ".nfo", payload.nfo.value_or(payload.mediainfo), "text/plain");
    form.add_file("torrent", payload.release_name + ".torrent", payload.torrent, "application/x-bittorrent");

    HttpRequest req;
    req.method = http::verb::post;
    req.url = target_.upload_url;
    req.timeout = policy_.submission_timeout;
    req.content_type = form.content_type();
    req.body = form.body();

    auto res = exchange(req, "upload", false);
    if (res.body.find("Duplicate torrent") != std::string::npos)
        throw TargetError(name(), "upload rejected: duplicate torrent", res.status);
    if (!res.ok()) fail(res, "upload");

    // success answers with the new torrent id
    SubmitResult result;
    auto body = trim(res.body);
    if (!body.empty() && std::all_of(body.begin(), body.end(), [](unsigned char c) { return std::isdigit(c); }))
        result.torrent_id = body;
    result.message = body.empty() ? "uploaded" : body;

    SEEDTOOLS_LOG(log_, info) << name() << ": uploaded " << payload.release_name;
    return result;
}
