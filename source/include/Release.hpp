#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

enum class ContentType { Movie, TVShow, Boxset, MusicAlbum, EBook, Other };

// "movie", "tv", "boxset", "music", "ebook", "other"
std::string content_type_name(ContentType type);
std::optional<ContentType> content_type_from_name(std::string_view name);

// video releases go through integrity checks, samples and screenshots; nothing else does
inline bool is_video(ContentType type) {
    return type == ContentType::Movie || type == ContentType::TVShow || type == ContentType::Boxset;
}

struct ReleaseFile {
    std::string path;       // '/'-separated, relative to the release root
    uint64_t size{};

    bool operator==(const ReleaseFile&) const = default;
};

struct Release {
    std::filesystem::path root;             // the file or directory given on the command line
    std::string name;                       // last path component
    std::vector<ReleaseFile> files;         // sorted by path
    uint64_t total_size{};
    bool single_file{};

    std::optional<ContentType> type_override;
};

// walks the path once; throws std::runtime_error if it does not exist or holds no files
Release scan_release(const std::filesystem::path& root);

// the release's own .nfo: the sibling of a single file, or the first one at the top of a directory
std::optional<std::filesystem::path> find_release_nfo(const Release& release);

// builds a release from an already known file list (sorted and summed here)
Release make_release(std::string name, std::vector<ReleaseFile> files, bool single_file = false,
                     std::filesystem::path root = {});

struct ParsedName {
    std::string title;
    std::optional<int> year;
    std::optional<int> season;
    std::optional<int> episode;
    std::optional<std::string> resolution;   // lowercase, e.g. "1080p"
    std::optional<std::string> author;       // e-books only ("Author - Title")
    std::string release_name;                // dot-separated scene style
};

ParsedName parse_release_name(std::string_view name, ContentType type);

// "Some Movie (2010) [1080p].mkv" -> "Some.Movie.2010.1080p"
std::string generate_release_name(std::string_view base_name);

// lowercase extension without the dot, empty when there is none
std::string file_extension(std::string_view path);
