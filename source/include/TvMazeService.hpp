#pragma once

#include <TmdbService.hpp>

// TVmaze /search/shows: no key needed, reports tvdb and imdb ids through "externals"
class TvMazeService : public IdentificationService {
public:
    TvMazeService(HttpTransport& transport, ServiceEndpoint endpoint, Logger& log)
        : transport_(transport), endpoint_(std::move(endpoint)), log_(log) {}

    std::string name() const override { return "tvmaze"; }
    bool supports(ContentType type) const override { return type == ContentType::TVShow || type == ContentType::Boxset; }
    std::vector<IdentifierCandidate> search(const IdentificationQuery& query) override;

    static constexpr size_t max_results = 5;

private:
    HttpTransport& transport_;
    ServiceEndpoint endpoint_;
    Logger& log_;
};
