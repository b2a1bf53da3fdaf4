#include <TmdbService.hpp>
#include <Errors.hpp>
#include <Utils.hpp>

#include <algorithm>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string TmdbService::get(const std::string& path_and_query, const std::string& what) {
    HttpRequest req;
    req.url = endpoint_.base_url + path_and_query + (path_and_query.find('?') == std::string::npos ? "?" : "&")
              + "api_key=" + url_encode(api_key_);
    req.timeout = endpoint_.timeout;
    req.headers.emplace_back("Accept", "application/json");

    return fetch(transport_, req, endpoint_.retry, log_, what).body;
}

std::vector<IdentifierCandidate> TmdbService::search(const IdentificationQuery& query) {
    bool tv = query.type == ContentType::TVShow || query.type == ContentType::Boxset;

    std::vector<std::pair<std::string, std::string>> params = { { "query", query.title } };
    if (!tv && query.year) params.emplace_back("year", std::to_string(*query.year));

    auto body = get(std::string(tv ? "/search/tv" : "/search/movie") + "?" + form_encode(params), "TMDB search");

    std::vector<IdentifierCandidate> tmdb_hits;
    try {
        auto j = json::parse(body);
        for (const auto& result : j.at("results")) {
            if (tmdb_hits.size() == max_results) break;

            IdentifierCandidate c;
            c.kind = IdentifierKind::Tmdb;
            c.service = name();
            c.value = std::to_string(result.at("id").get<long long>());
            c.title = result.value(tv ? "name" : "title", std::string{});
            auto date = result.value(tv ? "first_air_date" : "release_date", std::string{});
            c.year = year_from_date(date);
            c.confidence = score_candidate(query, c.title, c.year);
            tmdb_hits.push_back(std::move(c));
        }
    } catch (const json::exception& e) {
        throw ServiceError(std::string("TMDB search: malformed response: ") + e.what());
    }

    SEEDTOOLS_LOG(log_, debug) << "TMDB: " << tmdb_hits.size() << " result(s) for " << query.describe();

    std::stable_sort(tmdb_hits.begin(), tmdb_hits.end(),
                     [](const auto& a, const auto& b) { return a.confidence > b.confidence; });

    std::vector<IdentifierCandidate> out = tmdb_hits;

    size_t expanded = 0;
    for (const auto& hit : tmdb_hits) {
        if (expanded == max_expanded || hit.confidence < expand_threshold_) break;
        ++expanded;

        // a failed lookup costs the imdb/tvdb ids of this hit, not the whole search
        try {
            add_external_ids(tv, hit, out);
        } catch (const TransientNetworkError& e) {
            SEEDTOOLS_LOG(log_, warning) << "TMDB external ids for " << hit.value << ": " << e.what();
        } catch (const ServiceError& e) {
            SEEDTOOLS_LOG(log_, warning) << "TMDB external ids for " << hit.value << ": " << e.what();
        }
    }

    return out;
}

void TmdbService::add_external_ids(bool tv, const IdentifierCandidate& tmdb, std::vector<IdentifierCandidate>& out) {
    auto body = get(std::string(tv ? "/tv/" : "/movie/") + tmdb.value + "/external_ids", "TMDB external ids");

    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        throw ServiceError(std::string("TMDB external ids: malformed response: ") + e.what());
    }

    auto derived = [&](IdentifierKind kind, std::string value) {
        IdentifierCandidate c = tmdb;
        c.kind = kind;
        c.value = std::move(value);
        out.push_back(std::move(c));
    };

    if (j.contains("imdb_id") && j["imdb_id"].is_string() && !j["imdb_id"].get<std::string>().empty())
        derived(IdentifierKind::Imdb, j["imdb_id"].get<std::string>());

    if (j.contains("tvdb_id") && j["tvdb_id"].is_number_integer())
        derived(IdentifierKind::Tvdb, std::to_string(j["tvdb_id"].get<long long>()));
}
