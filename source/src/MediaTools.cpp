#include <MediaTools.hpp>
#include <Utils.hpp>

#include <algorithm>
#include <cstdio>
#include <stdexcept>

#include <sys/wait.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string run_command(const std::string& command) {
    FILE* pipe = popen((command + " 2>/dev/null").c_str(), "r");
    if (!pipe) throw std::runtime_error("cannot start: " + command);

    std::string output;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) output.append(buffer, n);

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
        throw std::runtime_error("command failed (status " + std::to_string(status) + "): " + command);

    return output;
}

std::string shell_quote(std::string_view arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    return quoted + "'";
}

TrackComposition parse_ffprobe_streams(const std::string& json_text) {
    TrackComposition tracks;
    try {
        auto j = json::parse(json_text);
        if (!j.contains("streams")) return tracks;

        for (const auto& stream : j.at("streams")) {
            auto codec_type = stream.value("codec_type", std::string{});
            // cover art shows up as a one-frame video stream
            bool attached_pic = stream.contains("disposition") && stream["disposition"].value("attached_pic", 0) == 1;

            if (codec_type == "video" && !attached_pic) ++tracks.video_tracks;
            else if (codec_type == "audio") ++tracks.audio_tracks;
            else if (codec_type == "subtitle") ++tracks.subtitle_tracks;
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("unreadable ffprobe output: ") + e.what());
    }
    return tracks;
}

std::string sanitize_mediainfo(const std::string& text, const std::string& file_name) {
    auto start = text.find("Complete name");
    if (start == std::string::npos) return text;

    auto end = text.find('\n', start);
    auto colon = text.find(':', start);
    if (colon == std::string::npos || (end != std::string::npos && colon > end)) return text;

    std::string result = text.substr(0, colon + 1) + " " + file_name;
    if (end != std::string::npos) result += text.substr(end);
    return result;
}

std::optional<std::filesystem::path> main_video_file(const Release& release) {
    std::optional<std::filesystem::path> best;
    uint64_t best_size = 0;

    for (const auto& f : release.files) {
        if (!is_video_extension(file_extension(f.path))) continue;
        if (best && f.size <= best_size) continue;

        best = release.single_file ? release.root : release.root / f.path;
        best_size = f.size;
    }
    return best;
}

TrackComposition FfprobeProber::probe(const std::filesystem::path& file) {
    auto output = run_command(shell_quote(ffprobe_) + " -v error -show_streams -of json " + shell_quote(file.string()));
    auto tracks = parse_ffprobe_streams(output);

    SEEDTOOLS_LOG(log_, debug) << file.filename().string() << ": " << tracks.video_tracks << " video, "
                               << tracks.audio_tracks << " audio, " << tracks.subtitle_tracks << " subtitle track(s)";
    return tracks;
}

double FfprobeProber::duration(const std::filesystem::path& file) const {
    auto output = trim(run_command(shell_quote(ffprobe_) + " -v error -show_entries format=duration"
                                   " -of default=noprint_wrappers=1:nokey=1 " + shell_quote(file.string())));
    try {
        return std::stod(output);
    } catch (const std::logic_error&) {
        throw std::runtime_error("cannot read duration of " + file.string() + ": '" + output + "'");
    }
}

MediaArtifacts ToolchainArtifactBuilder::build_media_artifacts(const Release& release, ContentType type) {
    MediaArtifacts artifacts;
    if (!is_video(type)) {
        SEEDTOOLS_LOG(log_, info) << release.name << ": " << content_type_name(type) << " release, no media artifacts";
        return artifacts;
    }

    auto video = main_video_file(release);
    if (!video) throw std::runtime_error(release.name + " has no video file");

    // integrity: the container has to open and carry a real video stream
    auto tracks = prober_.probe(*video);
    if (tracks.video_tracks == 0) throw std::runtime_error("integrity check failed: no video stream in " + video->filename().string());

    artifacts.mediainfo = sanitize_mediainfo(run_command(shell_quote(paths_.mediainfo) + " --Output=TEXT " + shell_quote(video->string())),
                                             video->filename().string());

    std::filesystem::create_directories(paths_.screenshots_dir);

    auto stem = generate_release_name(release.name);
    auto duration = prober_.duration(*video);
    artifacts.screenshots = take_screenshots(*video, stem, duration);
    artifacts.sample = cut_sample(*video, stem, duration);

    SEEDTOOLS_LOG(log_, info) << release.name << ": mediainfo, " << artifacts.screenshots.size() << " screenshot(s)"
                              << (artifacts.sample ? " and a sample" : "");
    return artifacts;
}

std::vector<std::filesystem::path> ToolchainArtifactBuilder::take_screenshots(const std::filesystem::path& video, const std::string& stem,
                                                                              double duration) const {
    std::vector<std::filesystem::path> shots;
    if (paths_.screenshot_count == 0 || duration <= 0) return shots;

    // evenly spread over the middle 70%, clear of intros and credits
    for (unsigned i = 0; i < paths_.screenshot_count; ++i) {
        auto at = static_cast<unsigned>(duration * (0.15 + 0.7 * (i + 0.5) / paths_.screenshot_count));
        auto out = paths_.screenshots_dir / (stem + "_" + std::to_string(i + 1) + ".jpg");

        run_command(shell_quote(paths_.ffmpeg) + " -y -loglevel error -ss " + std::to_string(at) + " -i " + shell_quote(video.string())
                    + " -vframes 1 -qscale:v 2 " + shell_quote(out.string()));
        shots.push_back(out);
    }
    return shots;
}

std::optional<std::filesystem::path> ToolchainArtifactBuilder::cut_sample(const std::filesystem::path& video, const std::string& stem,
                                                                         double duration) const {
    constexpr double sample_length = 20.0;
    if (duration < 2 * sample_length) return std::nullopt;

    auto start = static_cast<unsigned>(std::min(300.0, duration * 0.15));
    auto out = paths_.screenshots_dir / (stem + ".sample.mkv");

    try {
        run_command(shell_quote(paths_.ffmpeg) + " -y -loglevel error -ss " + std::to_string(start) + " -i " + shell_quote(video.string())
                    + " -t " + std::to_string(static_cast<unsigned>(sample_length)) + " -map 0 -c copy " + shell_quote(out.string()));
    } catch (const std::runtime_error& e) {
        SEEDTOOLS_LOG(log_, warning) << "No sample for " << video.filename().string() << ": " << e.what();
        return std::nullopt;
    }
    return out;
}

TorrentMetadata ToolchainArtifactBuilder::build_torrent(const Release& release, const TorrentOptions& options) {
    return builder_.build(release, options);
}
