#pragma once

#include <BaseTracker.hpp>

// UNIT3D JSON API: /api/torrents/filter for lookups, /api/torrents/upload for submissions
class Unit3dTracker : public BaseTracker {
public:
    using BaseTracker::BaseTracker;

    PreflightResult preflight(const PreflightQuery& query) override;

    std::vector<CatalogHit> search(const std::string& query, std::optional<uint64_t> size = std::nullopt) override;

    std::string download(const CatalogHit& hit) override;

    SubmitResult submit(const UploadPayload& payload, const CategoryAssignment& assignment) override;

    std::string protocol() const override { return "unit3d"; }

private:
    std::vector<CatalogHit> filter(const std::vector<std::pair<std::string, std::string>>& params, const std::string& what);
};
