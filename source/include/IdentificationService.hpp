#pragma once

#include <string>
#include <vector>

#include <Identity.hpp>

// An external database that maps a parsed title to identifiers.
// search() throws TransientNetworkError once its retries are spent and
// ServiceError for any other failure; no match at all is an empty vector.
class IdentificationService {
public:
    virtual ~IdentificationService() = default;

    virtual std::string name() const = 0;
    virtual bool supports(ContentType type) const = 0;
    virtual std::vector<IdentifierCandidate> search(const IdentificationQuery& query) = 0;
};
