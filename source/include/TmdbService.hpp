#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <HttpClient.hpp>
#include <IdentificationService.hpp>
#include <Logging.hpp>
#include <Retry.hpp>

// where and how patiently an identification service is asked
struct ServiceEndpoint {
    std::string base_url;
    std::chrono::milliseconds timeout{ 15000 };
    RetryPolicy retry;
};

// TMDB v3: /search/movie, /search/tv, then /{movie|tv}/{id}/external_ids for the
// best hits, so one search yields tmdb, imdb and (for TV) tvdb candidates.
class TmdbService : public IdentificationService {
public:
    TmdbService(HttpTransport& transport, ServiceEndpoint endpoint, std::string api_key,
                double expand_threshold, Logger& log)
        : transport_(transport),
          endpoint_(std::move(endpoint)),
          api_key_(std::move(api_key)),
          expand_threshold_(expand_threshold),
          log_(log) {}

    std::string name() const override { return "tmdb"; }
    bool supports(ContentType type) const override { return is_video(type); }
    std::vector<IdentifierCandidate> search(const IdentificationQuery& query) override;

    static constexpr size_t max_results = 5;
    static constexpr size_t max_expanded = 3;

private:
    std::string get(const std::string& path_and_query, const std::string& what);
    void add_external_ids(bool tv, const IdentifierCandidate& tmdb, std::vector<IdentifierCandidate>& out);

    HttpTransport& transport_;
    ServiceEndpoint endpoint_;
    std::string api_key_;
    double expand_threshold_;
    Logger& log_;
};
