#include <TorrentBuilder.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>

TorrentMetadata TorrentBuilder::build(const Release& release, const TorrentOptions& options) const {
    if (release.files.empty()) throw std::runtime_error("Nothing to hash in " + release.name);

    TorrentMetadata meta{};
    meta.announce = options.announce;
    meta.name = release.name;
    meta.multi_file = !release.single_file;
    meta.piece_length = options.piece_length.value_or(piece_length_for_size(release.total_size));
    meta.total_size = release.total_size;
    meta.is_private = options.is_private;
    meta.source = options.source;
    meta.comment = options.comment;
    meta.created_by = options.created_by;

    if (meta.piece_length == 0) throw std::invalid_argument("piece length must be positive");

    if (options.stamp_creation_date) {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        meta.creation_date = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }

    SEEDTOOLS_LOG(log_, info) << "Hashing " << release.files.size() << " file(s), " << release.total_size
                              << " bytes, piece length " << meta.piece_length;

    meta.piece_hashes.reserve(expected_piece_count(meta.total_size, meta.piece_length));

    std::string piece;
    piece.reserve(meta.piece_length);

    for (const auto& f : release.files) {
        meta.files.push_back({ f.path, f.size });

        auto path = release.single_file ? release.root : release.root / f.path;
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) throw std::runtime_error("Could not open file: " + path.string());

        uint64_t remaining = f.size;
        while (remaining > 0) {
            auto want = std::min<uint64_t>(remaining, meta.piece_length - piece.size());
            auto offset = piece.size();

            piece.resize(offset + want);
            in.read(piece.data() + offset, static_cast<std::streamsize>(want));
            if (static_cast<uint64_t>(in.gcount()) != want) {
                throw std::runtime_error("File changed size while hashing: " + path.string());
            }
            remaining -= want;

            if (piece.size() == meta.piece_length) {
                meta.piece_hashes.push_back(sha1_digest(piece));
                piece.clear();
            }
        }
    }

    // last piece is shorter
    if (!piece.empty()) meta.piece_hashes.push_back(sha1_digest(piece));

    SEEDTOOLS_LOG(log_, debug) << "Hashed " << meta.piece_hashes.size() << " pieces, info hash " << to_hex(info_hash(meta));

    return meta;
}

TorrentMetadata retarget(const TorrentMetadata& base, const std::string& announce,
                         std::optional<bool> is_private, const std::optional<std::string>& source) {
    TorrentMetadata meta = base;
    meta.announce = announce;
    meta.announce_list.clear();
    meta.is_private = is_private;
    meta.source = source;
    return meta;
}
