#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <ArtifactBuilder.hpp>
#include <Config.hpp>
#include <Logging.hpp>
#include <ReleaseClassifier.hpp>

// runs through /bin/sh and returns stdout; throws std::runtime_error when the command cannot start or exits non-zero
std::string run_command(const std::string& command);

// single-quoted for /bin/sh
std::string shell_quote(std::string_view arg);

// counts streams in `ffprobe -show_streams -of json` output; throws std::runtime_error on malformed JSON
TrackComposition parse_ffprobe_streams(const std::string& json_text);

// mediainfo prints the absolute path in "Complete name"; keep only the file name
std::string sanitize_mediainfo(const std::string& text, const std::string& file_name);

// largest video file of the release on disk
std::optional<std::filesystem::path> main_video_file(const Release& release);

class FfprobeProber : public MediaProber {
public:
    FfprobeProber(std::string ffprobe, Logger& log) : ffprobe_(std::move(ffprobe)), log_(log) {}

    TrackComposition probe(const std::filesystem::path& file) override;

    double duration(const std::filesystem::path& file) const;

private:
    std::string ffprobe_;
    Logger& log_;
};

// mediainfo + ffmpeg + native piece hashing
class ToolchainArtifactBuilder : public ArtifactBuilder {
public:
    ToolchainArtifactBuilder(PathsConfig paths, Logger& log)
        : paths_(std::move(paths)), prober_(paths_.ffprobe, log), builder_(log), log_(log) {}

    MediaArtifacts build_media_artifacts(const Release& release, ContentType type) override;

    TorrentMetadata build_torrent(const Release& release, const TorrentOptions& options) override;

private:
    std::vector<std::filesystem::path> take_screenshots(const std::filesystem::path& video, const std::string& stem, double duration) const;
    std::optional<std::filesystem::path> cut_sample(const std::filesystem::path& video, const std::string& stem, double duration) const;

    PathsConfig paths_;
    FfprobeProber prober_;
    TorrentBuilder builder_;
    Logger& log_;
};
