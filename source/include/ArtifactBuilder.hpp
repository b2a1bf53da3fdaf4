#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <Release.hpp>
#include <TorrentBuilder.hpp>

struct MediaArtifacts {
    std::string mediainfo;                              // empty for non-video releases
    std::vector<std::filesystem::path> screenshots;
    std::optional<std::filesystem::path> sample;
};

// Everything that touches the release on disk. Called at most once per release.
class ArtifactBuilder {
public:
    virtual ~ArtifactBuilder() = default;

    // integrity check, mediainfo, screenshots and sample; video types only, the rest get nothing
    virtual MediaArtifacts build_media_artifacts(const Release& release, ContentType type) = 0;

    virtual TorrentMetadata build_torrent(const Release& release, const TorrentOptions& options) = 0;
};
