#include <OpenLibraryService.hpp>
#include <Errors.hpp>
#include <Utils.hpp>

#include <algorithm>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// "/works/OL45883W" -> "OL45883W"
std::string work_id(const std::string& key) {
    auto slash = key.find_last_of('/');
    return slash == std::string::npos ? key : key.substr(slash + 1);
}

double author_agreement(const IdentificationQuery& query, const std::vector<std::string>& authors) {
    if (!query.author || authors.empty()) return 0.5;

    double best = 0.0;
    for (const auto& a : authors) best = std::max(best, title_similarity(*query.author, a));
    return best;
}

}

std::vector<IdentifierCandidate> OpenLibraryService::search(const IdentificationQuery& query) {
    std::vector<std::pair<std::string, std::string>> params = { { "title", query.title } };
    if (query.author) params.emplace_back("author", *query.author);
    params.emplace_back("limit", std::to_string(max_results));

    HttpRequest req;
    req.url = endpoint_.base_url + "/search.json?" + form_encode(params);
    req.timeout = endpoint_.timeout;

    auto body = fetch(transport_, req, endpoint_.retry, log_, "Open Library search").body;

    std::vector<IdentifierCandidate> out;
    try {
        auto j = json::parse(body);
        for (const auto& doc : j.at("docs")) {
            if (out.size() == max_results) break;
            if (!doc.contains("key") || !doc["key"].is_string()) continue;

            BookDetails book;
            book.title = doc.value("title", std::string{});
            if (doc.contains("author_name") && doc["author_name"].is_array())
                book.authors = doc["author_name"].get<std::vector<std::string>>();
            if (doc.contains("first_publish_year") && doc["first_publish_year"].is_number_integer())
                book.first_publish_year = doc["first_publish_year"].get<int>();
            if (doc.contains("cover_i") && doc["cover_i"].is_number_integer())
                book.cover_url = "https://covers.openlibrary.org/b/id/" + std::to_string(doc["cover_i"].get<long long>()) + "-L.jpg";
            if (doc.contains("first_sentence") && doc["first_sentence"].is_array() && !doc["first_sentence"].empty()
                && doc["first_sentence"][0].is_string())
                book.description = doc["first_sentence"][0].get<std::string>();

            IdentifierCandidate c;
            c.kind = IdentifierKind::OpenLibrary;
            c.service = name();
            c.value = work_id(doc["key"].get<std::string>());
            c.title = book.title;
            c.year = book.first_publish_year;
            c.confidence = 0.7 * title_similarity(query.title, book.title) + 0.3 * author_agreement(query, book.authors);
            c.book = std::move(book);
            out.push_back(std::move(c));
        }
    } catch (const json::exception& e) {
        throw ServiceError(std::string("Open Library search: malformed response: ") + e.what());
    }

    SEEDTOOLS_LOG(log_, debug) << "Open Library: " << out.size() << " candidate(s) for " << query.describe();
    return out;
}
