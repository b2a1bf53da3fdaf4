#include <ReleaseClassifier.hpp>

#include <algorithm>
#include <array>
#include <regex>

namespace {

const std::regex season_episode_regex(R"(\bS\d{2}E\d{2,3})", std::regex::icase);
const std::regex season_only_regex(R"(\bS\d{2}\b)", std::regex::icase);
const std::regex boxset_regex(R"(\b(boxset|complete|collection)\b)", std::regex::icase);
const std::regex disc_regex(R"(\b(disc|disk|cd)[ ._-]?\d{1,2}\b)", std::regex::icase);
const std::regex year_regex(R"(\b(19|20)\d{2}\b)");

template <size_t N>
bool contains(const std::array<const char*, N>& list, const std::string& ext) {
    return std::any_of(list.begin(), list.end(), [&ext](const char* e) { return ext == e; });
}

constexpr std::array<const char*, 9> video_extensions = { "mkv", "mp4", "m4v", "avi", "mov", "flv", "wmv", "ts", "m2ts" };
constexpr std::array<const char*, 10> audio_extensions = { "flac", "mp3", "m4a", "aac", "ogg", "opus", "wav", "alac", "ape", "wv" };
constexpr std::array<const char*, 9> ebook_extensions = { "epub", "mobi", "azw", "azw3", "pdf", "cbz", "cbr", "djvu", "fb2" };
constexpr std::array<const char*, 4> artwork_extensions = { "jpg", "jpeg", "png", "webp" };
constexpr std::array<const char*, 2> rip_log_extensions = { "cue", "log" };

struct FileCensus {
    size_t video{}, audio{}, ebook{}, artwork{}, rip_logs{};
    bool disc_markers{};
};

FileCensus take_census(const Release& release) {
    FileCensus census;
    for (const auto& f : release.files) {
        auto ext = file_extension(f.path);
        if (is_video_extension(ext)) ++census.video;
        else if (is_audio_extension(ext)) ++census.audio;
        else if (is_ebook_extension(ext)) ++census.ebook;
        else if (contains(artwork_extensions, ext)) ++census.artwork;
        else if (contains(rip_log_extensions, ext)) ++census.rip_logs;

        // only directory components count ("Disc 1/..."), file names are too noisy
        auto slash = f.path.find_last_of('/');
        if (slash != std::string::npos && std::regex_search(f.path.substr(0, slash), disc_regex)) census.disc_markers = true;
    }
    return census;
}

}

bool is_video_extension(const std::string& ext) { return contains(video_extensions, ext); }
bool is_audio_extension(const std::string& ext) { return contains(audio_extensions, ext); }
bool is_ebook_extension(const std::string& ext) { return contains(ebook_extensions, ext); }

Classification ReleaseClassifier::classify(const Release& release) const {
    if (release.type_override) {
        SEEDTOOLS_LOG(log_, debug) << release.name << ": type override " << content_type_name(*release.type_override);
        return { release.type_override, 1.0, "explicit override" };
    }

    auto candidate = classify_by_name(release);
    if (!candidate.type || candidate.confidence < threshold_) candidate = refine_by_tracks(release, std::move(candidate));

    if (candidate.type && candidate.confidence >= threshold_) {
        SEEDTOOLS_LOG(log_, info) << release.name << " classified as " << content_type_name(*candidate.type)
                                  << " (" << candidate.signal << ", confidence " << candidate.confidence << ")";
        return candidate;
    }

    SEEDTOOLS_LOG(log_, warning) << release.name << " is ambiguous, best signal: "
                                 << (candidate.signal.empty() ? "none" : candidate.signal);
    return { std::nullopt, candidate.confidence, candidate.signal.empty() ? "no signal" : candidate.signal };
}

Classification ReleaseClassifier::classify_by_name(const Release& release) const {
    auto census = take_census(release);
    const auto& name = release.name;

    if (census.video == 0) {
        if (census.ebook > 0 && census.audio == 0) return { ContentType::EBook, 0.9, "e-book file extensions" };

        if (census.audio > 0) {
            if (census.artwork > 0 || census.rip_logs > 0)
                return { ContentType::MusicAlbum, 0.9, "audio files with album art or rip logs" };
            return { ContentType::MusicAlbum, 0.7, "audio-only file extensions" };
        }

        return {};
    }

    if (std::regex_search(name, season_episode_regex)) return { ContentType::TVShow, 0.95, "season/episode marker" };

    if (std::regex_search(name, season_only_regex) || std::regex_search(name, boxset_regex)
        || std::regex_search(name, disc_regex) || census.disc_markers)
        return { ContentType::Boxset, 0.9, "season or boxset marker" };

    if (std::regex_search(name, year_regex)) return { ContentType::Movie, 0.8, "video files with a release year" };

    return { ContentType::Movie, 0.5, "video files without naming markers" };
}

Classification ReleaseClassifier::refine_by_tracks(const Release& release, Classification candidate) const {
    if (!prober_ || release.files.empty()) return candidate;

    // probe the largest video file, or the largest file when there is none
    auto largest = std::max_element(release.files.begin(), release.files.end(), [](const auto& a, const auto& b) {
        bool va = is_video_extension(file_extension(a.path)), vb = is_video_extension(file_extension(b.path));
        if (va != vb) return vb;
        return a.size < b.size;
    });

    auto path = release.single_file ? release.root : release.root / largest->path;

    TrackComposition tracks;
    try {
        tracks = prober_->probe(path);
    } catch (const std::exception& e) {
        SEEDTOOLS_LOG(log_, warning) << "Probing " << path.string() << " failed: " << e.what();
        return candidate;
    }

    if (tracks.video_tracks > 0) {
        if (candidate.type && is_video(*candidate.type)) {
            candidate.confidence = std::min(1.0, candidate.confidence + 0.2);
            candidate.signal += ", confirmed by video tracks";
            return candidate;
        }
        return { ContentType::Movie, 0.6, "video tracks present" };
    }

    if (tracks.audio_tracks > 0) return { ContentType::MusicAlbum, 0.75, "audio-only media tracks" };

    return candidate;
}
