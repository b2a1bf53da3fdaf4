#pragma once

#include <string>
#include <vector>
#include <optional>

#include <Config.hpp>
#include <HttpClient.hpp>
#include <Identity.hpp>
#include <Logging.hpp>
#include <Release.hpp>

// one torrent in a tracker's catalog
struct CatalogHit {
    std::string id;
    std::string name;
    uint64_t size{};
    std::optional<std::string> info_hash;       // hex, when the tracker reports it
    std::optional<std::string> download_link;
};

struct PreflightQuery {
    std::string release_name;
    ParsedName parsed;
    ContentType type = ContentType::Other;
    IdentitySet identities;
    uint64_t total_size{};
};

struct PreflightResult {
    bool duplicate{};
    std::vector<CatalogHit> candidates;
    std::string reason;
};

struct UploadPayload {
    std::string release_name;
    ContentType type = ContentType::Other;
    ParsedName parsed;
    IdentitySet identities;
    std::string torrent;                    // bencoded, already carrying this tracker's announce/source
    std::string description;
    std::string mediainfo;
    std::optional<std::string> nfo;
};

struct SubmitResult {
    std::optional<std::string> torrent_id;
    std::optional<std::string> download_link;
    std::string message;
};

class BaseTracker {
public:
    BaseTracker(TrackerTarget target, HttpTransport& transport, const Policy& policy, Logger& log)
        : target_(std::move(target)), transport_(transport), policy_(policy), log_(log) {}
    virtual ~BaseTracker() = default;

    // duplicate check before any artifact is built; throws TargetError once retries are spent
    virtual PreflightResult preflight(const PreflightQuery& query) = 0;

    // catalog lookup by release name (cross-seed sync)
    virtual std::vector<CatalogHit> search(const std::string& query, std::optional<uint64_t> size = std::nullopt) = 0;

    virtual std::string download(const CatalogHit& hit) = 0;

    // never retried; throws TargetError carrying the HTTP status and the tracker's message
    virtual SubmitResult submit(const UploadPayload& payload, const CategoryAssignment& assignment) = 0;

    virtual std::string protocol() const = 0;

    const std::string& name() const { return target_.name; }
    const TrackerTarget& target() const { return target_; }

protected:
    // retried for idempotent queries; transport failures become TargetError either way
    HttpResponse exchange(const HttpRequest& request, const std::string& what, bool retry);

    [[noreturn]] void fail(const HttpResponse& response, const std::string& what) const;

    TrackerTarget target_;
    HttpTransport& transport_;
    Policy policy_;
    Logger& log_;
};

// "tt0111161" -> "0111161"; UNIT3D wants the bare number
std::string imdb_digits(const std::string& imdb);
