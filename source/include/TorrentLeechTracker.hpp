#pragma once

#include <BaseTracker.hpp>

// TorrentLeech announce-key API. Uploads take an .nfo, the tracker has no catalog search.
class TorrentLeechTracker : public BaseTracker {
public:
    using BaseTracker::BaseTracker;

    PreflightResult preflight(const PreflightQuery& query) override;

    std::vector<CatalogHit> search(const std::string& query, std::optional<uint64_t> size = std::nullopt) override;

    std::string download(const CatalogHit& hit) override;

    SubmitResult submit(const UploadPayload& payload, const CategoryAssignment& assignment) override;

    std::string protocol() const override { return "torrentleech"; }
};
