#pragma once

#include <optional>
#include <string>
#include <vector>

#include <Release.hpp>

enum class IdentifierKind { Tmdb, Imdb, Tvdb, OpenLibrary };

std::string identifier_kind_name(IdentifierKind kind);

struct BookDetails {
    std::string title;
    std::vector<std::string> authors;
    std::optional<int> first_publish_year;
    std::optional<std::string> cover_url;
    std::optional<std::string> description;
};

// one hit reported by one identification service
struct IdentifierCandidate {
    IdentifierKind kind = IdentifierKind::Tmdb;
    std::string value;
    std::string title;
    std::optional<int> year;
    double confidence{};
    std::string service;
    std::optional<BookDetails> book;    // bibliographic services only
};

struct ResolvedIdentifier {
    std::string value;
    double confidence{};
    std::string query;                      // the query that produced it
    std::vector<std::string> services;      // every service that reported this value
    bool ambiguous{};                       // several values cleared the threshold
};

struct IdentitySet {
    std::optional<ResolvedIdentifier> tmdb;
    std::optional<ResolvedIdentifier> imdb;
    std::optional<ResolvedIdentifier> tvdb;
    std::optional<ResolvedIdentifier> open_library;
    std::optional<BookDetails> book;

    std::optional<ResolvedIdentifier>& slot(IdentifierKind kind);
    const std::optional<ResolvedIdentifier>& slot(IdentifierKind kind) const;

    bool empty() const { return !tmdb && !imdb && !tvdb && !open_library; }
};

struct IdentificationQuery {
    ContentType type = ContentType::Movie;
    std::string title;
    std::optional<int> year;
    std::optional<int> season;
    std::optional<std::string> author;

    std::string describe() const;
};

IdentificationQuery make_query(ContentType type, const ParsedName& parsed);

// 0.7 x title similarity + 0.3 x year agreement. A missing year, or one off by one,
// scores half; series run for years, so a TV year mismatch also scores half.
double score_candidate(const IdentificationQuery& query, const std::string& title, std::optional<int> year);

// "YYYY-MM-DD" or "YYYY" -> YYYY
std::optional<int> year_from_date(const std::string& date);
