#include <TvMazeService.hpp>
#include <Errors.hpp>
#include <Utils.hpp>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::vector<IdentifierCandidate> TvMazeService::search(const IdentificationQuery& query) {
    HttpRequest req;
    req.url = endpoint_.base_url + "/search/shows?" + form_encode({ { "q", query.title } });
    req.timeout = endpoint_.timeout;

    auto body = fetch(transport_, req, endpoint_.retry, log_, "TVmaze search").body;

    std::vector<IdentifierCandidate> out;
    size_t shows = 0;

    try {
        auto j = json::parse(body);
        for (const auto& hit : j) {
            if (shows++ == max_results) break;

            const auto& show = hit.at("show");

            IdentifierCandidate base;
            base.service = name();
            base.title = show.value("name", std::string{});
            if (show.contains("premiered") && show["premiered"].is_string())
                base.year = year_from_date(show["premiered"].get<std::string>());
            base.confidence = score_candidate(query, base.title, base.year);

            if (!show.contains("externals") || !show["externals"].is_object()) continue;
            const auto& externals = show["externals"];

            if (externals.contains("thetvdb") && externals["thetvdb"].is_number_integer()) {
                IdentifierCandidate c = base;
                c.kind = IdentifierKind::Tvdb;
                c.value = std::to_string(externals["thetvdb"].get<long long>());
                out.push_back(std::move(c));
            }
            if (externals.contains("imdb") && externals["imdb"].is_string()) {
                IdentifierCandidate c = base;
                c.kind = IdentifierKind::Imdb;
                c.value = externals["imdb"].get<std::string>();
                out.push_back(std::move(c));
            }
        }
    } catch (const json::exception& e) {
        throw ServiceError(std::string("TVmaze search: malformed response: ") + e.what());
    }

    SEEDTOOLS_LOG(log_, debug) << "TVmaze: " << out.size() << " candidate(s) for " << query.describe();
    return out;
}
