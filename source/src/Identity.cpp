#include <Identity.hpp>
#include <Utils.hpp>

#include <cctype>
#include <cstdlib>
#include <sstream>

std::string identifier_kind_name(IdentifierKind kind) {
    switch (kind) {
        case IdentifierKind::Tmdb:        return "tmdb";
        case IdentifierKind::Imdb:        return "imdb";
        case IdentifierKind::Tvdb:        return "tvdb";
        case IdentifierKind::OpenLibrary: return "open_library";
    }
    return "unknown";
}

std::optional<ResolvedIdentifier>& IdentitySet::slot(IdentifierKind kind) {
    switch (kind) {
        case IdentifierKind::Tmdb:        return tmdb;
        case IdentifierKind::Imdb:        return imdb;
        case IdentifierKind::Tvdb:        return tvdb;
        case IdentifierKind::OpenLibrary: return open_library;
    }
    return tmdb;
}

const std::optional<ResolvedIdentifier>& IdentitySet::slot(IdentifierKind kind) const {
    switch (kind) {
        case IdentifierKind::Tmdb:        return tmdb;
        case IdentifierKind::Imdb:        return imdb;
        case IdentifierKind::Tvdb:        return tvdb;
        case IdentifierKind::OpenLibrary: return open_library;
    }
    return tmdb;
}

std::string IdentificationQuery::describe() const {
    std::ostringstream oss;
    oss << content_type_name(type) << " \"" << title << '"';
    if (year) oss << " year=" << *year;
    if (season) oss << " season=" << *season;
    if (author) oss << " author=\"" << *author << '"';
    return oss.str();
}

IdentificationQuery make_query(ContentType type, const ParsedName& parsed) {
    IdentificationQuery query;
    query.type = type;
    query.title = parsed.title;
    query.year = parsed.year;
    if (type == ContentType::TVShow || type == ContentType::Boxset) query.season = parsed.season;
    if (type == ContentType::EBook) query.author = parsed.author;
    return query;
}

double score_candidate(const IdentificationQuery& query, const std::string& title, std::optional<int> year) {
    double similarity = title_similarity(query.title, title);

    double year_score = 0.0;
    if (!query.year || !year) year_score = 0.5;
    else if (*query.year == *year) year_score = 1.0;
    else if (std::abs(*query.year - *year) == 1) year_score = 0.5;
    else if (query.type == ContentType::TVShow || query.type == ContentType::Boxset) year_score = 0.5;

    return 0.7 * similarity + 0.3 * year_score;
}

std::optional<int> year_from_date(const std::string& date) {
    if (date.size() < 4) return std::nullopt;
    for (size_t i = 0; i < 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return std::nullopt;
    }
    if (date.size() > 4 && date[4] != '-') return std::nullopt;
    return std::stoi(date.substr(0, 4));
}
