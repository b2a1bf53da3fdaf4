#pragma once

#include <TmdbService.hpp>

// Open Library /search.json by title and author; the bibliographic service for e-books
class OpenLibraryService : public IdentificationService {
public:
    OpenLibraryService(HttpTransport& transport, ServiceEndpoint endpoint, Logger& log)
        : transport_(transport), endpoint_(std::move(endpoint)), log_(log) {}

    std::string name() const override { return "open_library"; }
    bool supports(ContentType type) const override { return type == ContentType::EBook; }
    std::vector<IdentifierCandidate> search(const IdentificationQuery& query) override;

    static constexpr size_t max_results = 5;

private:
    HttpTransport& transport_;
    ServiceEndpoint endpoint_;
    Logger& log_;
};
