#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <Logging.hpp>
#include <Release.hpp>

struct TrackComposition {
    unsigned video_tracks{};
    unsigned audio_tracks{};
    unsigned subtitle_tracks{};
};

// media-track probing collaborator (ffprobe in production); throws on failure
class MediaProber {
public:
    virtual ~MediaProber() = default;
    virtual TrackComposition probe(const std::filesystem::path& file) = 0;
};

struct Classification {
    std::optional<ContentType> type;    // empty means Ambiguous
    double confidence{};
    std::string signal;                 // what decided it

    bool ambiguous() const { return !type.has_value(); }
};

class ReleaseClassifier {
public:
    ReleaseClassifier(double threshold, MediaProber* prober, Logger& log)
        : threshold_(threshold), prober_(prober), log_(log) {}

    // override > naming conventions > media tracks; Ambiguous below the threshold
    Classification classify(const Release& release) const;

    double threshold() const { return threshold_; }

private:
    Classification classify_by_name(const Release& release) const;
    Classification refine_by_tracks(const Release& release, Classification candidate) const;

    double threshold_;
    MediaProber* prober_;
    Logger& log_;
};

bool is_video_extension(const std::string& ext);
bool is_audio_extension(const std::string& ext);
bool is_ebook_extension(const std::string& ext);
