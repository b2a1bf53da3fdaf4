#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <ArtifactBuilder.hpp>
#include <BaseTracker.hpp>
#include <Config.hpp>
#include <Errors.hpp>
#include <HttpClient.hpp>
#include <IdentificationService.hpp>
#include <Logging.hpp>
#include <ReleaseClassifier.hpp>
#include <SeedingClient.hpp>
#include <TorrentFile.hpp>

inline Logger& test_logger() {
    static Logger log;
    return log;
}

// retries in tests should not sleep for real
inline RetryPolicy quick_retry(unsigned attempts = 3) {
    RetryPolicy retry;
    retry.attempts = attempts;
    retry.initial_backoff = std::chrono::milliseconds(1);
    retry.max_backoff = std::chrono::milliseconds(2);
    return retry;
}

inline Policy quick_policy() {
    Policy policy;
    policy.retry = quick_retry();
    return policy;
}

inline HttpResponse respond(unsigned status, std::string body) {
    HttpResponse res;
    res.status = status;
    res.body = std::move(body);
    return res;
}

// Answers by the longest registered URL prefix; an unknown URL behaves like a dead host.
class FakeTransport : public HttpTransport {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    void route(const std::string& prefix, Handler handler) {
        std::lock_guard lock(mutex_);
        routes_[prefix] = std::move(handler);
    }

    void route(const std::string& prefix, unsigned status, std::string body) {
        route(prefix, [status, body](const HttpRequest&) { return respond(status, body); });
    }

    // answers from the list in order, repeating the last one
    void route_sequence(const std::string& prefix, std::vector<HttpResponse> responses) {
        auto index = std::make_shared<size_t>(0);
        route(prefix, [index, responses](const HttpRequest&) {
            auto i = std::min(*index, responses.size() - 1);
            ++*index;
            return responses[i];
        });
    }

    HttpResponse send(const HttpRequest& request) override {
        Handler handler;
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);

            const std::string* best = nullptr;
            for (const auto& [prefix, h] : routes_) {
                if (request.url.rfind(prefix, 0) == 0 && (!best || prefix.size() > best->size())) best = &prefix;
            }
            if (!best) throw TransientNetworkError("connection refused: " + request.url);

            ++counts_[*best];
            handler = routes_[*best];
        }
        return handler(request);
    }

    size_t calls(const std::string& prefix) const {
        std::lock_guard lock(mutex_);
        auto it = counts_.find(prefix);
        return it == counts_.end() ? 0 : it->second;
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Handler> routes_;
    std::map<std::string, size_t> counts_;
    std::vector<HttpRequest> requests_;
};

enum class ServiceFailure { None, Unreachable, Rejected };

class FakeService : public IdentificationService {
public:
    FakeService(std::string name, std::set<ContentType> types, std::vector<IdentifierCandidate> candidates = {},
                ServiceFailure failure = ServiceFailure::None)
        : name_(std::move(name)), types_(std::move(types)), candidates_(std::move(candidates)), failure_(failure) {}

    std::string name() const override { return name_; }
    bool supports(ContentType type) const override { return types_.contains(type); }

    std::vector<IdentifierCandidate> search(const IdentificationQuery& query) override {
        ++calls;
        {
            std::lock_guard lock(mutex_);
            last_query = query;
        }
        if (failure_ == ServiceFailure::Unreachable) throw TransientNetworkError(name_ + " timed out");
        if (failure_ == ServiceFailure::Rejected) throw ServiceError(name_ + " said no", 401);

        auto out = candidates_;
        for (auto& c : out) c.service = name_;
        return out;
    }

    std::atomic<int> calls{ 0 };
    std::optional<IdentificationQuery> last_query;

private:
    std::string name_;
    std::set<ContentType> types_;
    std::vector<IdentifierCandidate> candidates_;
    ServiceFailure failure_;
    std::mutex mutex_;
};

inline IdentifierCandidate candidate(IdentifierKind kind, std::string value, std::string title, double confidence,
                                     std::optional<int> year = std::nullopt) {
    IdentifierCandidate c;
    c.kind = kind;
    c.value = std::move(value);
    c.title = std::move(title);
    c.confidence = confidence;
    c.year = year;
    return c;
}

inline HttpTransport& idle_transport() {
    static FakeTransport transport;
    return transport;
}

inline TrackerTarget make_target(const std::string& name, std::vector<ContentType> types = { ContentType::Movie }) {
    TrackerTarget target;
    target.name = name;
    target.api_key = "key-" + name;
    target.base_url = "https://" + name + ".example";
    target.announce_url = "https://" + name + ".example/announce/key";
    target.upload_url = target.base_url + "/api/torrents/upload";
    target.search_url = target.base_url + "/api/torrents/filter";
    target.source = name;

    unsigned id = 1;
    for (auto type : types) {
        target.categories.set_category(type, id, id + 10);
        ++id;
    }
    target.categories.set_resolution("1080p", 3);
    return target;
}

// A tracker with scripted answers and call counters.
class FakeTracker : public BaseTracker {
public:
    explicit FakeTracker(TrackerTarget target) : BaseTracker(std::move(target), idle_transport(), quick_policy(), test_logger()) {}

    PreflightResult preflight(const PreflightQuery& query) override {
        ++preflights;
        return on_preflight(query);
    }

    // the whole catalog of that size, whatever the name
    std::vector<CatalogHit> search(const std::string&, std::optional<uint64_t> size) override {
        ++searches;
        if (search_fails) throw TargetError(name(), "catalog search returned HTTP 503", 503);

        std::vector<CatalogHit> out;
        for (const auto& hit : catalog) {
            if (size && hit.size != *size) continue;
            out.push_back(hit);
        }
        return out;
    }

    std::string download(const CatalogHit& hit) override {
        ++downloads;
        if (!hit.download_link) throw TargetError(name(), "no download link");
        auto it = blobs.find(*hit.download_link);
        if (it == blobs.end()) throw TargetError(name(), "torrent download returned HTTP 404", 404);
        return it->second;
    }

    SubmitResult submit(const UploadPayload& payload, const CategoryAssignment& assignment) override {
        ++submits;
        {
            std::lock_guard lock(mutex_);
            submitted.push_back(payload);
            assignments.push_back(assignment);
        }
        return on_submit(payload);
    }

    std::string protocol() const override { return "fake"; }

    // adds a catalog entry that downloads as the given torrent
    void publish(const TorrentMetadata& meta, const std::string& link) {
        auto bytes = encode_torrent(meta);
        catalog.push_back({ link, meta.name, meta.total_size, to_hex(info_hash(meta)), link });
        blobs[link] = bytes;
    }

    std::function<PreflightResult(const PreflightQuery&)> on_preflight = [](const PreflightQuery&) { return PreflightResult{}; };
    std::function<SubmitResult(const UploadPayload&)> on_submit = [](const UploadPayload&) {
        return SubmitResult{ std::string("42"), std::nullopt, "uploaded" };
    };

    std::vector<CatalogHit> catalog;
    std::map<std::string, std::string> blobs;
    bool search_fails = false;

    std::atomic<int> preflights{ 0 };
    std::atomic<int> submits{ 0 };
    std::atomic<int> searches{ 0 };
    std::atomic<int> downloads{ 0 };

    std::vector<UploadPayload> submitted;
    std::vector<CategoryAssignment> assignments;

private:
    std::mutex mutex_;
};

class FakeClient : public SeedingClient {
public:
    struct Added {
        std::string bytes;
        std::string file_name;
        AddTorrentOptions options;
    };

    std::string name() const override { return "fake-client"; }

    std::vector<SeedingEntry> list_completed() override {
        ++listings;
        return entries;
    }

    void add_torrent(const std::string& torrent_bytes, const std::string& file_name, const AddTorrentOptions& options) override {
        if (reject_adds) throw ServiceError("add rejected", 415);
        std::lock_guard lock(mutex_);
        added.push_back({ torrent_bytes, file_name, options });
    }

    std::vector<SeedingEntry> entries;
    std::vector<Added> added;
    bool reject_adds = false;
    std::atomic<int> listings{ 0 };

private:
    std::mutex mutex_;
};

class FakeProber : public MediaProber {
public:
    explicit FakeProber(TrackComposition tracks, bool fails = false) : tracks_(tracks), fails_(fails) {}

    TrackComposition probe(const std::filesystem::path&) override {
        ++probes;
        if (fails_) throw std::runtime_error("ffprobe exited with status 1");
        return tracks_;
    }

    int probes{};

private:
    TrackComposition tracks_;
    bool fails_;
};

// Metadata built from the file list alone; nothing is read from disk.
class FakeArtifactBuilder : public ArtifactBuilder {
public:
    MediaArtifacts build_media_artifacts(const Release& release, ContentType type) override {
        ++media_calls;
        if (media_fails) throw std::runtime_error("no video stream in " + release.name);

        MediaArtifacts artifacts;
        if (is_video(type)) {
            artifacts.mediainfo = "General\nComplete name : " + release.name + "\n";
            artifacts.screenshots = { "screenshots/shot_1.jpg", "screenshots/shot_2.jpg" };
        }
        return artifacts;
    }

    TorrentMetadata build_torrent(const Release& release, const TorrentOptions& options) override {
        ++torrent_calls;

        TorrentMetadata meta;
        meta.announce = options.announce;
        meta.name = release.name;
        meta.multi_file = !release.single_file;
        meta.piece_length = piece_length_for_size(release.total_size);
        meta.total_size = release.total_size;
        meta.is_private = options.is_private;
        meta.source = options.source;
        for (const auto& f : release.files) meta.files.push_back({ f.path, f.size });

        auto pieces = expected_piece_count(meta.total_size, meta.piece_length);
        for (uint64_t i = 0; i < pieces; ++i) meta.piece_hashes.push_back(sha1_digest(release.name + std::to_string(i)));
        return meta;
    }

    int media_calls{};
    int torrent_calls{};
    bool media_fails = false;
};

// valid metadata with made-up piece hashes
inline TorrentMetadata synthetic_torrent(const std::string& name, std::vector<TorrentFile> files, bool multi_file = true,
                                         uint64_t piece_length = 16384) {
    TorrentMetadata meta;
    meta.announce = "https://tracker.example/announce";
    meta.name = name;
    meta.multi_file = multi_file;
    meta.piece_length = piece_length;
    meta.files = std::move(files);
    for (const auto& f : meta.files) meta.total_size += f.length;

    auto pieces = expected_piece_count(meta.total_size, piece_length);
    for (uint64_t i = 0; i < pieces; ++i) meta.piece_hashes.push_back(sha1_digest(name + "/" + std::to_string(i)));
    return meta;
}
