#include <Config.hpp>
#include <Errors.hpp>

#include <filesystem>
#include <fstream>

#include <doctest/doctest.h>

namespace {

const char* full_config = R"({
    "logging": { "level": "debug", "console": false, "file": "seed-tools.log" },
    "paths": { "torrent_dir": "out", "screenshot_count": 6, "image_base_url": "https://img.example/shots/" },
    "policy": {
        "classification_threshold": 0.5,
        "max_concurrency": 2,
        "identification_timeout_ms": 5000,
        "retry": { "attempts": 5, "initial_backoff_ms": 100, "max_backoff_ms": 1000, "multiplier": 3 }
    },
    "services": { "tmdb_api_key": "KEY", "tmdb_url": "https://tmdb.test/3/", "tvmaze": false },
    "qbittorrent": [
        { "webui_url": "http://localhost:8080/", "username": "admin", "password": "secret", "category": "cross-seed" }
    ],
    "trackers": [
        {
            "name": "alpha", "kind": "unit3d", "base_url": "https://alpha.example/",
            "announce_url": "https://alpha.example/announce/KEY", "api_key": "TOKEN",
            "anonymous": true, "inject_after_upload": true,
            "categories": {
                "movie": { "category_id": 1, "type_id": 2 },
                "tv": { "category_id": 2, "type_id": 2 }
            },
            "resolutions": { "1080P": 3, "other": 10 }
        },
        {
            "name": "leech", "kind": "TorrentLeech", "announce_url": "https://tracker.tleechreload.org/a/KEY/announce",
            "api_key": "ANNOUNCEKEY", "source": "TL", "private": true,
            "categories": { "movie": { "category_id": 14 } }
        }
    ]
})";

std::string with_tracker(const std::string& tracker) {
    return R"({"trackers":[)" + tracker + "]}";
}

}

TEST_CASE("a full config parses with every section") {
    auto config = parse_config(full_config);

    CHECK(config.logging.level == "debug");
    CHECK_FALSE(config.logging.console);
    CHECK(config.logging.file == std::optional<std::string>("seed-tools.log"));

    CHECK(config.paths.torrent_dir == std::filesystem::path("out"));
    CHECK(config.paths.screenshot_count == 6);
    CHECK(config.paths.image_base_url == std::optional<std::string>("https://img.example/shots"));
    CHECK(config.paths.ffprobe == "ffprobe");

    CHECK(config.policy.classification_threshold == doctest::Approx(0.5));
    CHECK(config.policy.acceptance_threshold == doctest::Approx(0.75));
    CHECK(config.policy.max_concurrency == 2);
    CHECK(config.policy.identification_timeout.count() == 5000);
    CHECK(config.policy.submission_timeout.count() == 60000);
    CHECK(config.policy.retry.attempts == 5);
    CHECK(config.policy.retry.multiplier == doctest::Approx(3.0));
    CHECK(config.policy.retry.max_backoff.count() == 1000);

    CHECK(config.services.tmdb_api_key == std::optional<std::string>("KEY"));
    CHECK(config.services.tmdb_url == "https://tmdb.test/3");
    CHECK_FALSE(config.services.tvmaze);
    CHECK(config.services.open_library);

    REQUIRE(config.qbittorrent.size() == 1);
    CHECK(config.qbittorrent[0].webui_url == "http://localhost:8080");
    CHECK(config.qbittorrent[0].category == std::optional<std::string>("cross-seed"));

    REQUIRE(config.trackers.size() == 2);
    const auto* alpha = config.find_tracker("alpha");
    REQUIRE(alpha != nullptr);
    CHECK(alpha->kind == TrackerKind::Unit3d);
    CHECK(alpha->upload_url == "https://alpha.example/api/torrents/upload");
    CHECK(alpha->search_url == "https://alpha.example/api/torrents/filter");
    CHECK(alpha->source == "alpha");
    CHECK(alpha->anonymous);
    CHECK(alpha->inject_after_upload);
    CHECK_FALSE(alpha->cross_seed_duplicates);
    CHECK(alpha->categories.supports(ContentType::TVShow));
    CHECK_FALSE(alpha->categories.supports(ContentType::EBook));

    const auto* leech = config.find_tracker("leech");
    REQUIRE(leech != nullptr);
    CHECK(leech->kind == TrackerKind::TorrentLeech);
    CHECK(leech->upload_url == "https://www.torrentleech.org/torrents/upload/apiupload");
    CHECK(leech->search_url == "https://www.torrentleech.org/api/torrentsearch");
    CHECK(leech->source == "TL");

    CHECK(config.find_tracker("gamma") == nullptr);
}

TEST_CASE("an empty object is a valid config with the documented defaults") {
    auto config = parse_config("{}");
    CHECK(config.trackers.empty());
    CHECK(config.qbittorrent.empty());
    CHECK(config.policy.classification_threshold == doctest::Approx(0.6));
    CHECK(config.policy.file_layout_score == doctest::Approx(0.8));
    CHECK(config.policy.cross_seed_action_threshold == doctest::Approx(0.8));
    CHECK(config.policy.max_concurrency == 4);
    CHECK_FALSE(config.services.tmdb_api_key.has_value());
    CHECK_FALSE(config.paths.image_base_url.has_value());
}

TEST_CASE("category mappings pick the resolution or fall back to other") {
    auto config = parse_config(full_config);
    const auto& categories = config.find_tracker("alpha")->categories;

    CHECK(categories.assignment_for(ContentType::Movie, std::string("1080p")) == CategoryAssignment{ 1, 2, 3u });
    CHECK(categories.assignment_for(ContentType::Movie, std::string("1080P")) == CategoryAssignment{ 1, 2, 3u });
    CHECK(categories.assignment_for(ContentType::TVShow, std::string("480p")) == CategoryAssignment{ 2, 2, 10u });
    CHECK(categories.assignment_for(ContentType::TVShow, std::nullopt) == CategoryAssignment{ 2, 2, 10u });
    CHECK_FALSE(categories.assignment_for(ContentType::MusicAlbum, std::nullopt).has_value());

    CHECK(categories.type_for_category(2) == std::optional<ContentType>(ContentType::TVShow));
    CHECK_FALSE(categories.type_for_category(99).has_value());

    const auto& leech = config.find_tracker("leech")->categories;
    auto assignment = leech.assignment_for(ContentType::Movie, std::string("1080p"));
    REQUIRE(assignment.has_value());
    CHECK(assignment->category_id == 14);
    CHECK(assignment->type_id == 0);
    CHECK_FALSE(assignment->resolution_id.has_value());
}

TEST_CASE("malformed documents are config errors") {
    CHECK_THROWS_AS(parse_config("{ not json"), ConfigError);
    CHECK_THROWS_AS(parse_config("[1, 2]"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"policy": 3})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"trackers": {}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"qbittorrent": [{}]})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"logging": {"level": "loud"}})"), ConfigError);
    CHECK_THROWS_WITH_AS(parse_config(R"({"paths": {"screenshot_count": "four"}})"), doctest::Contains("paths.screenshot_count"),
                         ConfigError);
}

TEST_CASE("policy values are range checked") {
    CHECK_THROWS_AS(parse_config(R"({"policy": {"acceptance_threshold": 1.5}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"policy": {"file_layout_score": -0.1}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"policy": {"max_concurrency": 0}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"policy": {"submission_timeout_ms": 0}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"policy": {"retry": {"attempts": 0}}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"policy": {"retry": {"multiplier": 0.5}}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"policy": {"retry": {"initial_backoff_ms": 500, "max_backoff_ms": 100}}})"), ConfigError);
    CHECK_NOTHROW(parse_config(R"({"policy": {"acceptance_threshold": 1.0, "classification_threshold": 0}})"));
}

TEST_CASE("trackers need a name, a known kind and their endpoints") {
    CHECK_THROWS_WITH_AS(parse_config(with_tracker(R"({"kind": "unit3d"})")), doctest::Contains("name is required"), ConfigError);
    CHECK_THROWS_WITH_AS(parse_config(with_tracker(R"({"name": "x", "kind": "gazelle", "announce_url": "a", "api_key": "k"})")),
                         doctest::Contains("kind"), ConfigError);
    CHECK_THROWS_AS(parse_config(with_tracker(R"({"name": "x", "kind": "unit3d", "api_key": "k", "base_url": "b"})")), ConfigError);
    CHECK_THROWS_WITH_AS(parse_config(with_tracker(R"({"name": "x", "kind": "unit3d", "announce_url": "a", "api_key": "k"})")),
                         doctest::Contains("base_url"), ConfigError);
    CHECK_THROWS_WITH_AS(parse_config(with_tracker(R"({"name": "x", "kind": "unit3d", "announce_url": "a", "base_url": "b"})")),
                         doctest::Contains("api_key"), ConfigError);

    // a disabled tracker may leave its key out
    auto config = parse_config(with_tracker(R"({"name": "x", "kind": "unit3d", "announce_url": "a", "base_url": "b", "enabled": false})"));
    CHECK_FALSE(config.trackers.at(0).enabled);
}

TEST_CASE("category tables are validated when loaded") {
    auto tracker = [](const std::string& categories) {
        return with_tracker(R"({"name": "x", "kind": "unit3d", "announce_url": "a", "base_url": "b", "api_key": "k", )"
                            + categories + "}");
    };

    CHECK_THROWS_WITH_AS(parse_config(tracker(R"("categories": {"films": {"category_id": 1, "type_id": 1}})")),
                         doctest::Contains("unknown content type"), ConfigError);
    CHECK_THROWS_AS(parse_config(tracker(R"("categories": {"tvshow": {"category_id": 1, "type_id": 1}})")), ConfigError);
    CHECK_THROWS_AS(parse_config(tracker(R"("categories": {"movie": {"type_id": 1}})")), ConfigError);
    CHECK_THROWS_AS(parse_config(tracker(R"("categories": {"movie": {"category_id": 1}})")), ConfigError);
    CHECK_THROWS_AS(parse_config(tracker(R"("categories": {"movie": {"category_id": 0, "type_id": 1}})")), ConfigError);
    CHECK_THROWS_AS(parse_config(tracker(R"("categories": {"movie": {"category_id": "1", "type_id": 1}})")), ConfigError);
    CHECK_THROWS_AS(parse_config(tracker(R"("resolutions": {"1080p": -3})")), ConfigError);
}

TEST_CASE("tracker names are unique") {
    const std::string one = R"({"name": "x", "kind": "unit3d", "announce_url": "a", "base_url": "b", "api_key": "k"})";
    CHECK_THROWS_WITH_AS(parse_config(with_tracker(one + "," + one)), doctest::Contains("duplicate tracker name"), ConfigError);
}

TEST_CASE("an empty TMDB key counts as none") {
    auto config = parse_config(R"({"services": {"tmdb_api_key": ""}})");
    CHECK_FALSE(config.services.tmdb_api_key.has_value());
}

TEST_CASE("configs load from disk") {
    auto path = std::filesystem::temp_directory_path() / "seedtools-config-test.json";
    {
        std::ofstream out(path);
        out << full_config;
    }

    auto config = load_config(path);
    CHECK(config.trackers.size() == 2);
    std::filesystem::remove(path);

    CHECK_THROWS_WITH_AS(load_config(path), doctest::Contains("cannot open"), ConfigError);
}
