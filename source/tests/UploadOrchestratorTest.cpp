#include <UploadJob.hpp>
#include <UploadOrchestrator.hpp>
#include <Unit3dTracker.hpp>
#include <Utils.hpp>

#include "TestFakes.hpp"

#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <doctest/doctest.h>

namespace {

constexpr uint64_t GiB = 1024ull * 1024ull * 1024ull;

const std::string movie_name = "Some.Movie.2010.1080p.BluRay.x264-GRP";
const std::set<ContentType> video = { ContentType::Movie, ContentType::TVShow, ContentType::Boxset };

Release movie_release() {
    return make_release(movie_name,
                        { { movie_name + ".mkv", 7 * GiB / 2 - 4096 }, { movie_name + ".nfo", 4096 } },
                        false, "/data/" + movie_name);
}

PreflightResult duplicate_of(const std::string& name) {
    return { true, {}, "duplicate of '" + name + "'" };
}

// the collaborators every run needs, with two services agreeing on the movie
struct Pipeline {
    Pipeline()
        : tmdb(std::make_shared<FakeService>("tmdb", video, std::vector<IdentifierCandidate>{
              candidate(IdentifierKind::Tmdb, "27205", "Some Movie", 0.95, 2010) })),
          mirror(std::make_shared<FakeService>("mirror", video, std::vector<IdentifierCandidate>{
              candidate(IdentifierKind::Tmdb, "27205", "Some Movie", 0.9, 2010) })),
          classifier(policy.classification_threshold, nullptr, test_logger()),
          resolver({ tmdb, mirror }, policy, test_logger()) {}

    std::shared_ptr<FakeTracker> tracker(const std::string& name, std::vector<ContentType> types = { ContentType::Movie }) {
        auto t = std::make_shared<FakeTracker>(make_target(name, std::move(types)));
        trackers.push_back(t);
        return t;
    }

    UploadJob run(const Release& release, bool preflight_only = false, SeedingClient* client = nullptr,
                  OrchestratorSettings settings = {}) {
        std::vector<std::shared_ptr<BaseTracker>> targets(real_trackers.begin(), real_trackers.end());
        targets.insert(targets.end(), trackers.begin(), trackers.end());
        UploadOrchestrator orchestrator(policy, classifier, resolver, targets, artifacts, client, settings, test_logger());
        return orchestrator.run({ release, preflight_only });
    }

    Policy policy = quick_policy();
    std::shared_ptr<FakeService> tmdb;
    std::shared_ptr<FakeService> mirror;
    ReleaseClassifier classifier;
    MetadataResolver resolver;
    FakeArtifactBuilder artifacts;
    std::vector<std::shared_ptr<FakeTracker>> trackers;
    std::vector<std::shared_ptr<BaseTracker>> real_trackers;
};

}

TEST_CASE("overall outcome algebra") {
    using K = OutcomeKind;
    CHECK(overall_outcome({ K::Succeeded, K::Failed }) == OverallOutcome::PartialFailure);
    CHECK(overall_outcome({ K::Succeeded, K::Succeeded }) == OverallOutcome::Succeeded);
    CHECK(overall_outcome({ K::Failed, K::Failed }) == OverallOutcome::Failed);
    CHECK(overall_outcome({ K::Skipped, K::Skipped }) == OverallOutcome::Skipped);
    CHECK(overall_outcome({ K::Skipped, K::Succeeded }) == OverallOutcome::PartialFailure);
    CHECK(overall_outcome({ K::Pending }) == OverallOutcome::Failed);
    CHECK(overall_outcome({}) == OverallOutcome::Skipped);
}

TEST_CASE("upload jobs only move along the pipeline") {
    UploadJob job("R", { "a", "b" });
    CHECK(job.state() == JobState::Classifying);
    CHECK_THROWS_AS(job.advance(JobState::Submitting), std::logic_error);

    job.advance(JobState::Resolving);
    job.advance(JobState::Preflight);
    CHECK_THROWS_AS(job.advance(JobState::Done), std::logic_error);

    job.outcome("a") = TargetOutcome::skipped("duplicate");
    CHECK(job.pending_targets() == std::vector<std::string>{ "b" });
    CHECK_THROWS_AS(job.outcome("c"), std::out_of_range);

    job.fail("boom");
    CHECK(job.state() == JobState::Failed);
    CHECK(job.outcome("a").kind == OutcomeKind::Skipped);
    CHECK(job.outcome("b").kind == OutcomeKind::Failed);
    CHECK(job.fatal_error == std::optional<std::string>("boom"));
    CHECK_THROWS_AS(job.advance(JobState::Failed), std::logic_error);
    CHECK(job.history().size() == 4);
}

TEST_CASE("a 409 at one tracker and a clean upload at another is a partial failure") {
    Pipeline p;
    auto alpha = p.tracker("alpha");
    auto beta = p.tracker("beta");
    alpha->on_preflight = [](const PreflightQuery&) -> PreflightResult {
        throw TargetError("alpha", "duplicate search returned HTTP 409", 409);
    };

    auto job = p.run(movie_release());

    CHECK(job.type == std::optional<ContentType>(ContentType::Movie));
    REQUIRE(job.identities.tmdb.has_value());
    CHECK(job.identities.tmdb->value == "27205");
    CHECK(job.identities.tmdb->confidence == doctest::Approx(0.95));
    CHECK(job.identities.tmdb->services.size() == 2);
    CHECK_FALSE(job.identities.tmdb->ambiguous);

    CHECK(job.outcome("alpha").kind == OutcomeKind::Skipped);
    CHECK(job.outcome("alpha").reason.find("409") != std::string::npos);
    CHECK(job.outcome("beta").kind == OutcomeKind::Succeeded);
    CHECK(job.overall() == OverallOutcome::PartialFailure);
    CHECK(job.state() == JobState::Done);
    CHECK(job.history() == std::vector<JobState>{ JobState::Classifying, JobState::Resolving, JobState::Preflight,
                                                  JobState::Building, JobState::Submitting, JobState::Done });

    CHECK(p.artifacts.media_calls == 1);
    CHECK(p.artifacts.torrent_calls == 1);
    CHECK(alpha->submits.load() == 0);
    REQUIRE(beta->submits.load() == 1);

    const auto& payload = beta->submitted.front();
    CHECK(payload.release_name == movie_name);
    CHECK(payload.identities.tmdb->value == "27205");
    CHECK(payload.description.find("https://www.themoviedb.org/movie/27205") != std::string::npos);

    auto torrent = decode_torrent(payload.torrent);
    CHECK(torrent.announce == "https://beta.example/announce/key");
    CHECK(torrent.source == std::optional<std::string>("beta"));
    CHECK(torrent.is_private == std::optional<bool>(true));
    CHECK(torrent.total_size == 7 * GiB / 2);

    CHECK(beta->assignments.front() == CategoryAssignment{ 1, 11, 3u });

    std::ostringstream report;
    UploadOrchestrator::report(job, report);
    CHECK(report.str().find("  alpha: Skipped (duplicate (HTTP 409))") != std::string::npos);
    CHECK(report.str().find("  beta: Succeeded") != std::string::npos);
    CHECK(report.str().find(movie_name + ": PartialFailure") != std::string::npos);
}

TEST_CASE("when every target already has the release nothing is built or sent") {
    Pipeline p;
    auto alpha = p.tracker("alpha");
    auto beta = p.tracker("beta");
    alpha->on_preflight = [](const PreflightQuery&) { return duplicate_of("Some Movie 2010"); };
    beta->on_preflight = [](const PreflightQuery&) { return duplicate_of("Some.Movie.2010.720p"); };

    auto job = p.run(movie_release());

    CHECK(job.overall() == OverallOutcome::Skipped);
    CHECK(job.state() == JobState::Done);
    CHECK(alpha->preflights.load() == 1);
    CHECK(beta->preflights.load() == 1);
    CHECK(p.artifacts.media_calls == 0);
    CHECK(p.artifacts.torrent_calls == 0);
    CHECK(alpha->submits.load() == 0);
    CHECK(beta->submits.load() == 0);
    CHECK(job.outcome("beta").reason == "duplicate of 'Some.Movie.2010.720p'");
}

TEST_CASE("preflight-only runs stop before building") {
    Pipeline p;
    auto alpha = p.tracker("alpha");

    auto job = p.run(movie_release(), true);

    CHECK(alpha->preflights.load() == 1);
    CHECK(p.artifacts.media_calls == 0);
    CHECK(job.outcome("alpha").kind == OutcomeKind::Skipped);
    CHECK(job.outcome("alpha").reason == "preflight only, no duplicate");
    CHECK(job.overall() == OverallOutcome::Skipped);
}

TEST_CASE("an ambiguous release fails before any network work") {
    Pipeline p;
    auto alpha = p.tracker("alpha");

    auto job = p.run(make_release("stuff", { { "a.bin", 10 } }, false, "/data/stuff"));

    CHECK(job.state() == JobState::Failed);
    REQUIRE(job.fatal_error.has_value());
    CHECK(job.fatal_error->find("--type") != std::string::npos);
    CHECK(job.outcome("alpha").kind == OutcomeKind::Failed);
    CHECK(job.overall() == OverallOutcome::Failed);
    CHECK(alpha->preflights.load() == 0);
    CHECK(p.tmdb->calls.load() == 0);
}

TEST_CASE("an override settles an otherwise ambiguous release") {
    Pipeline p;
    auto alpha = p.tracker("alpha", { ContentType::Other });

    auto release = make_release("stuff", { { "a.bin", 10 } }, false, "/data/stuff");
    release.type_override = ContentType::Other;
    auto job = p.run(release);

    CHECK(job.type == std::optional<ContentType>(ContentType::Other));
    CHECK(job.outcome("alpha").kind == OutcomeKind::Succeeded);
    CHECK(p.tmdb->calls.load() == 0);
}

TEST_CASE("unreachable identification services are fatal for a movie") {
    Pipeline p;
    auto alpha = p.tracker("alpha");
    auto down = std::make_shared<FakeService>("down", video, std::vector<IdentifierCandidate>{}, ServiceFailure::Unreachable);
    MetadataResolver resolver({ down }, p.policy, test_logger());

    std::vector<std::shared_ptr<BaseTracker>> targets{ alpha };
    UploadOrchestrator orchestrator(p.policy, p.classifier, resolver, targets, p.artifacts, nullptr, {}, test_logger());
    auto job = orchestrator.run({ movie_release(), false });

    CHECK(job.state() == JobState::Failed);
    CHECK(job.overall() == OverallOutcome::Failed);
    CHECK(alpha->preflights.load() == 0);
}

TEST_CASE("a target without the category is skipped, the rest carry on") {
    Pipeline p;
    auto tv_only = p.tracker("tvonly", { ContentType::TVShow });
    auto beta = p.tracker("beta");

    auto job = p.run(movie_release());

    CHECK(job.outcome("tvonly").kind == OutcomeKind::Skipped);
    CHECK(job.outcome("tvonly").reason == "unsupported content type movie");
    CHECK(tv_only->preflights.load() == 0);
    CHECK(job.outcome("beta").kind == OutcomeKind::Succeeded);
}

TEST_CASE("submission failures stay with their target") {
    Pipeline p;
    auto alpha = p.tracker("alpha");
    auto beta = p.tracker("beta");
    alpha->on_submit = [](const UploadPayload&) -> SubmitResult {
        throw TargetError("alpha", "upload returned HTTP 422: The name has already been taken.", 422);
    };

    SUBCASE("one fails") {
        auto job = p.run(movie_release());
        CHECK(job.outcome("alpha").kind == OutcomeKind::Failed);
        CHECK(job.outcome("alpha").status == std::optional<unsigned>(422u));
        CHECK(job.outcome("beta").kind == OutcomeKind::Succeeded);
        CHECK(job.overall() == OverallOutcome::PartialFailure);

        std::ostringstream report;
        UploadOrchestrator::report(job, report);
        CHECK(report.str().find("[HTTP 422]") != std::string::npos);
    }

    SUBCASE("both fail") {
        beta->on_submit = alpha->on_submit;
        auto job = p.run(movie_release());
        CHECK(job.overall() == OverallOutcome::Failed);
        CHECK(p.artifacts.torrent_calls == 1);
    }
}

TEST_CASE("an odd upload answer from one tracker does not lose the other uploads") {
    FakeTransport transport;
    transport.route("https://alpha.example/api/torrents/filter", 200, R"({"data":[]})");
    transport.route("https://alpha.example/api/torrents/upload", 200,
                    R"({"success":true,"data":"https://alpha.example/dl/9","message":null})");

    Pipeline p;
    p.real_trackers.push_back(std::make_shared<Unit3dTracker>(make_target("alpha"), transport, p.policy, test_logger()));
    auto beta = p.tracker("beta");

    auto job = p.run(movie_release());
    CHECK(job.outcome("alpha").kind == OutcomeKind::Succeeded);
    CHECK(job.outcome("alpha").reason == "uploaded");
    CHECK(job.outcome("beta").kind == OutcomeKind::Succeeded);
    CHECK(beta->submits.load() == 1);
    CHECK(job.overall() == OverallOutcome::Succeeded);
}

TEST_CASE("exceptions outside the error taxonomy stay with their target") {
    Pipeline p;
    auto alpha = p.tracker("alpha");
    auto beta = p.tracker("beta");

    SUBCASE("at preflight") {
        alpha->on_preflight = [](const PreflightQuery&) -> PreflightResult { throw std::out_of_range("stoul"); };
        auto job = p.run(movie_release());
        CHECK(job.outcome("alpha").kind == OutcomeKind::Failed);
        CHECK(job.outcome("alpha").reason == "alpha: stoul");
        CHECK(job.outcome("beta").kind == OutcomeKind::Succeeded);
        CHECK(job.overall() == OverallOutcome::PartialFailure);
    }

    SUBCASE("at submission") {
        alpha->on_submit = [](const UploadPayload&) -> SubmitResult { throw std::logic_error("bad state"); };
        auto job = p.run(movie_release());
        CHECK(job.outcome("alpha").kind == OutcomeKind::Failed);
        CHECK(job.outcome("beta").kind == OutcomeKind::Succeeded);
        CHECK(job.overall() == OverallOutcome::PartialFailure);
    }
}

TEST_CASE("a broken release fails the job at the build stage") {
    Pipeline p;
    auto alpha = p.tracker("alpha");
    p.artifacts.media_fails = true;

    auto job = p.run(movie_release());

    CHECK(job.state() == JobState::Failed);
    REQUIRE(job.fatal_error.has_value());
    CHECK(job.fatal_error->find("artifact build failed") == 0);
    CHECK(job.outcome("alpha").kind == OutcomeKind::Failed);
    CHECK(alpha->submits.load() == 0);
}

TEST_CASE("music skips resolution and goes straight to the trackers") {
    Pipeline p;
    auto alpha = p.tracker("alpha", { ContentType::MusicAlbum });

    auto album = make_release("Artist - Album (2001) [FLAC]", { { "01.flac", 100 }, { "cover.jpg", 10 } }, false, "/data/album");
    auto job = p.run(album);

    CHECK(job.type == std::optional<ContentType>(ContentType::MusicAlbum));
    CHECK(p.tmdb->calls.load() == 0);
    CHECK(job.history()[1] == JobState::Preflight);
    CHECK(job.outcome("alpha").kind == OutcomeKind::Succeeded);
    REQUIRE(alpha->submitted.size() == 1);
    CHECK(alpha->submitted.front().mediainfo.empty());
}

TEST_CASE("uploads can be handed to the local client") {
    Pipeline p;
    auto target = make_target("alpha");
    target.inject_after_upload = true;
    auto alpha = std::make_shared<FakeTracker>(target);
    p.trackers.push_back(alpha);

    FakeClient client;
    auto job = p.run(movie_release(), false, &client);

    CHECK(job.outcome("alpha").kind == OutcomeKind::Succeeded);
    CHECK(job.outcome("alpha").reason.find("seeding in fake-client") != std::string::npos);
    REQUIRE(client.added.size() == 1);
    CHECK(client.added.front().file_name == movie_name + ".torrent");
    CHECK(client.added.front().options.save_path == "/data");
    CHECK(client.added.front().bytes == alpha->submitted.front().torrent);
}

TEST_CASE("a failed hand-off to the client does not undo the upload") {
    Pipeline p;
    auto target = make_target("alpha");
    target.inject_after_upload = true;
    auto alpha = std::make_shared<FakeTracker>(target);
    p.trackers.push_back(alpha);

    FakeClient client;
    client.reject_adds = true;
    auto job = p.run(movie_release(), false, &client);

    CHECK(job.outcome("alpha").kind == OutcomeKind::Succeeded);
    CHECK(job.outcome("alpha").reason.find("not added to the client") != std::string::npos);
}

TEST_CASE("a duplicate with the same files can be cross-seeded instead") {
    Pipeline p;
    auto target = make_target("alpha");
    target.cross_seed_duplicates = true;
    auto alpha = std::make_shared<FakeTracker>(target);
    p.trackers.push_back(alpha);

    const std::string name = "Cross.Release.2010.1080p";
    auto release = make_release(name, { { "a.mkv", 50000 }, { "b.nfo", 10 } }, false, "/data/" + name);
    alpha->publish(synthetic_torrent(name, { { "a.mkv", 50000 }, { "b.nfo", 10 } }), "https://alpha.example/dl/1");

    auto* tracker = alpha.get();
    alpha->on_preflight = [tracker, name](const PreflightQuery&) {
        return PreflightResult{ true, tracker->catalog, "duplicate of '" + name + "'" };
    };

    FakeClient client;
    auto job = p.run(release, false, &client);

    CHECK(job.outcome("alpha").kind == OutcomeKind::Skipped);
    CHECK(job.outcome("alpha").reason == "duplicate of '" + name + "', cross-seeded");
    REQUIRE(client.added.size() == 1);
    CHECK(client.added.front().bytes == alpha->blobs.at("https://alpha.example/dl/1"));
    CHECK(client.added.front().options.save_path == "/data");
    CHECK(p.artifacts.torrent_calls == 0);
}

TEST_CASE("a duplicate packed as a folder is not cross-seeded over a single file") {
    Pipeline p;
    auto target = make_target("alpha");
    target.cross_seed_duplicates = true;
    auto alpha = std::make_shared<FakeTracker>(target);
    p.trackers.push_back(alpha);

    const std::string name = "Cross.Release.2010.1080p.mkv";
    auto release = make_release(name, { { name, 50000 } }, true, "/data/" + name);
    alpha->publish(synthetic_torrent(name, { { name, 50000 } }, true), "https://alpha.example/dl/1");

    auto* tracker = alpha.get();
    alpha->on_preflight = [tracker, name](const PreflightQuery&) {
        return PreflightResult{ true, tracker->catalog, "duplicate of '" + name + "'" };
    };

    FakeClient client;
    auto job = p.run(release, false, &client);

    CHECK(job.outcome("alpha").kind == OutcomeKind::Skipped);
    CHECK(job.outcome("alpha").reason == "duplicate of '" + name + "'");
    CHECK(client.added.empty());
}

TEST_CASE("submitted torrents are kept on disk when asked") {
    Pipeline p;
    p.tracker("alpha");

    auto dir = std::filesystem::temp_directory_path() / "seedtools-kept-torrents";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    OrchestratorSettings settings;
    settings.torrent_dir = dir;
    settings.image_base_url = "https://img.example/shots";

    auto job = p.run(movie_release(), false, nullptr, settings);

    CHECK(job.outcome("alpha").kind == OutcomeKind::Succeeded);
    CHECK(std::filesystem::exists(dir / (movie_name + ".alpha.torrent")));
    CHECK(p.trackers.front()->submitted.front().description.find("https://img.example/shots/shot_1.jpg") != std::string::npos);

    std::filesystem::remove_all(dir, ec);
}

TEST_CASE("the release's own nfo goes out with every upload") {
    Pipeline p;
    p.tracker("alpha");
    p.tracker("beta");

    auto dir = std::filesystem::temp_directory_path() / "seedtools-nfo-upload" / movie_name;
    std::error_code ec;
    std::filesystem::remove_all(dir.parent_path(), ec);
    std::filesystem::create_directories(dir);
    write_to_file((dir / (movie_name + ".mkv")).string(), std::string(4096, 'v'));
    write_to_file((dir / "release.NFO").string(), "Some Movie (2010)\r\nSource: BluRay");

    auto job = p.run(scan_release(dir));

    CHECK(job.overall() == OverallOutcome::Succeeded);
    for (const auto& tracker : p.trackers) {
        REQUIRE(tracker->submitted.size() == 1);
        CHECK(tracker->submitted.front().nfo == std::optional<std::string>("Some Movie (2010)\r\nSource: BluRay"));
    }

    SUBCASE("a release without one sends none") {
        Pipeline bare;
        bare.tracker("alpha");
        bare.run(movie_release());
        CHECK_FALSE(bare.trackers.front()->submitted.front().nfo.has_value());
    }

    std::filesystem::remove_all(dir.parent_path(), ec);
}

TEST_CASE("a release on disk fingerprints like the torrent it would become") {
    auto release = make_release("R", { { "b.mkv", 2 }, { "a.mkv", 3 } }, false, "/data/R");
    auto fp = fingerprint_of(release);
    CHECK(fp.name == "R");
    CHECK(fp.multi_file);
    CHECK(fp.total_size == 5);
    CHECK(fp.files == std::vector<TorrentFile>{ { "a.mkv", 3 }, { "b.mkv", 2 } });
}
