// canonical encode/decode of .torrent metadata and info-hash derivation

#pragma once

#include <vector>
#include <string>
#include <optional>
#include <array>
#include <cstdint>
#include <cstring>
#include <openssl/sha.h>

// my headers
#include <Bencode.hpp>

using Sha1Digest = std::array<uint8_t, 20>;
using InfoHash = Sha1Digest;
using PieceHash = Sha1Digest;

struct TorrentFile {
    std::string path;       // '/'-separated, relative to the torrent root
    uint64_t length{};

    bool operator==(const TorrentFile&) const = default;
};

struct TorrentMetadata {
    std::string announce;                                   // primary tracker URL
    std::vector<std::vector<std::string>> announce_list;    // list of tracker URLs by hierarchy

    std::string name;                                       // ------
    uint64_t piece_length{};                                //      |
    std::vector<PieceHash> piece_hashes;                    //      | <-- contained in
    std::vector<TorrentFile> files;                         //      | <-- info dict
    bool multi_file{};                                      //      |
    std::optional<bool> is_private;                         //      |
    std::optional<std::string> source;                      // ------

    // info keys we do not model; kept so foreign torrents hash the same after a round trip
    BEncodeValue::Dict info_extensions;

    // OPTIONALS

    std::optional<std::string> comment;
    std::optional<std::string> created_by;
    std::optional<uint64_t> creation_date;                  // epoch time

    // -- END OPTIONALS

    uint64_t total_size{};

    bool operator==(const TorrentMetadata&) const = default;
};

TorrentMetadata decode_torrent(const std::string& in);

std::string encode_torrent(const TorrentMetadata& meta);

BEncodeValue info_dictionary(const TorrentMetadata& meta);

// SHA-1 over the canonical encoding of the info dictionary only
InfoHash info_hash(const TorrentMetadata& meta);

// SHA-1 over the info dictionary bytes exactly as they appear in a torrent blob
InfoHash raw_info_hash(const std::string& torrent_bytes);

Sha1Digest sha1_digest(const void* data, size_t size);
inline Sha1Digest sha1_digest(const std::string& data) { return sha1_digest(data.data(), data.size()); }

std::string to_hex(const Sha1Digest& digest);
std::optional<InfoHash> info_hash_from_hex(const std::string& hex);

// piece size for a new torrent, monotonic in the total size
uint64_t piece_length_for_size(uint64_t total_size);

inline uint64_t expected_piece_count(uint64_t total_size, uint64_t piece_length) {
    return piece_length == 0 ? 0 : (total_size + piece_length - 1) / piece_length;
}
