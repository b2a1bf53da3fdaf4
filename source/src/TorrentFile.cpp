#include <TorrentFile.hpp>

#include <algorithm>
#include <initializer_list>

namespace {

const BEncodeValue::Dict& require_dict(const BEncodeValue& v, const char* what) {
    if (!v.is_dict()) throw DecodeError(std::string(what) + " is not a dictionary");
    return v.as_dict();
}

const BEncodeValue& require_key(const BEncodeValue::Dict& dict, const std::string& key, const char* where) {
    auto it = dict.find(key);
    if (it == dict.end()) throw DecodeError(std::string(where) + " is missing '" + key + "'");
    return it->second;
}

uint64_t require_length(const BEncodeValue& v, const char* what) {
    if (!v.is_int()) throw DecodeError(std::string(what) + " is not an integer");
    if (v.as_int() < 0) throw DecodeError(std::string(what) + " is negative");
    return static_cast<uint64_t>(v.as_int());
}

std::string join_path(const BEncodeValue& path_value) {
    if (!path_value.is_list() || path_value.as_list().empty())
        throw DecodeError("file path is not a non-empty list");

    std::string full_path;
    for (const auto& component : path_value.as_list()) {
        if (!component.is_string()) throw DecodeError("file path component is not a string");
        const auto& part = component.as_string();
        if (part.empty() || part == "." || part == ".." || part.find('/') != std::string::npos)
            throw DecodeError("invalid file path component '" + part + "'");
        if (!full_path.empty()) full_path += '/';
        full_path += part;
    }
    return full_path;
}

BEncodeValue split_path(const std::string& path) {
    BEncodeValue::List parts;
    size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        parts.push_back(BEncodeValue{ path.substr(start, slash - start) });
        start = slash + 1;
    }
    return BEncodeValue{ std::move(parts) };
}

const std::initializer_list<const char*> modelled_info_keys = {
    "name", "piece length", "pieces", "length", "files", "private", "source"
};

bool is_modelled(const std::string& key) {
    return std::any_of(modelled_info_keys.begin(), modelled_info_keys.end(),
                       [&key](const char* k) { return key == k; });
}

}

TorrentMetadata decode_torrent(const std::string& in) {

    BEncodeParser parser(in);

    auto root = parser.parse();
    const auto& dict = require_dict(root, "torrent");

    TorrentMetadata meta{};

    // top level is lenient: clients attach all sorts of extension keys
    auto it = dict.find("announce");
    if (it != dict.end() && it->second.is_string()) {
        meta.announce = it->second.as_string();
    }

    it = dict.find("announce-list");
    if (it != dict.end() && it->second.is_list()) {
        for (const auto& tier_val : it->second.as_list()) {
            std::vector<std::string> tier;
            if (tier_val.is_list()) {
                for (const auto& tracker : tier_val.as_list()) {
                    if (tracker.is_string()) tier.push_back(tracker.as_string());
                }
            }
            if (!tier.empty()) meta.announce_list.push_back(std::move(tier));
        }
    }

    auto comment_it = dict.find("comment");
    if (comment_it != dict.end() && comment_it->second.is_string())
        meta.comment = comment_it->second.as_string();

    auto created_by_it = dict.find("created by");
    if (created_by_it != dict.end() && created_by_it->second.is_string())
        meta.created_by = created_by_it->second.as_string();

    auto creation_date_it = dict.find("creation date");
    if (creation_date_it != dict.end() && creation_date_it->second.is_int() && creation_date_it->second.as_int() >= 0)
        meta.creation_date = static_cast<uint64_t>(creation_date_it->second.as_int());

    // Info dictionary (required, strict)
    const auto& info = require_dict(require_key(dict, "info", "torrent"), "info");

    const auto& name_val = require_key(info, "name", "info");
    if (!name_val.is_string() || name_val.as_string().empty()) throw DecodeError("info name is not a non-empty string");
    meta.name = name_val.as_string();

    meta.piece_length = require_length(require_key(info, "piece length", "info"), "piece length");
    if (meta.piece_length == 0) throw DecodeError("piece length is zero");

    // Pieces (concatenated SHA1 hashes)
    const auto& pieces_val = require_key(info, "pieces", "info");
    if (!pieces_val.is_string()) throw DecodeError("pieces is not a byte string");
    const std::string& pieces_str = pieces_val.as_string();
    if (pieces_str.size() % 20 != 0) throw DecodeError("pieces length is not a multiple of 20");
    size_t n = pieces_str.size() / 20;
    meta.piece_hashes.resize(n);
    for (size_t i = 0; i < n; ++i) {
        std::memcpy(meta.piece_hashes[i].data(), pieces_str.data() + i * 20, 20);
    }

    auto files_it = info.find("files");
    auto len_it = info.find("length");
    if (files_it != info.end() && len_it != info.end()) throw DecodeError("info has both 'length' and 'files'");

    if (files_it != info.end()) {
        // Multi-file torrent
        if (!files_it->second.is_list() || files_it->second.as_list().empty())
            throw DecodeError("files is not a non-empty list");

        meta.multi_file = true;
        for (const auto& fval : files_it->second.as_list()) {
            const auto& fdict = require_dict(fval, "file entry");

            TorrentFile file;
            file.path = join_path(require_key(fdict, "path", "file entry"));
            file.length = require_length(require_key(fdict, "length", "file entry"), "file length");
            meta.total_size += file.length;

            meta.files.push_back(std::move(file));
        }
    }
    else if (len_it != info.end()) {
        // Single-file torrent
        auto length = require_length(len_it->second, "length");
        meta.files.push_back({ meta.name, length });
        meta.total_size = length;
    }
    else {
        throw DecodeError("info has neither 'length' nor 'files'");
    }

    if (meta.piece_hashes.size() != expected_piece_count(meta.total_size, meta.piece_length)) {
        throw DecodeError("piece count " + std::to_string(meta.piece_hashes.size()) +
                          " does not match total size " + std::to_string(meta.total_size));
    }

    auto private_it = info.find("private");
    if (private_it != info.end()) {
        if (!private_it->second.is_int()) throw DecodeError("private flag is not an integer");
        meta.is_private = private_it->second.as_int() == 1;
    }

    auto source_it = info.find("source");
    if (source_it != info.end()) {
        if (!source_it->second.is_string()) throw DecodeError("source is not a string");
        meta.source = source_it->second.as_string();
    }

    for (const auto& [key, value] : info) {
        if (!is_modelled(key)) meta.info_extensions.emplace(key, value);
    }

    return meta;
}

BEncodeValue info_dictionary(const TorrentMetadata& meta) {
    BEncodeValue::Dict info = meta.info_extensions;

    if (meta.multi_file) {
        BEncodeValue::List files;
        for (const auto& file : meta.files) {
            BEncodeValue::Dict entry;
            entry["length"] = BEncodeValue{ static_cast<int64_t>(file.length) };
            entry["path"] = split_path(file.path);
            files.push_back(BEncodeValue{ std::move(entry) });
        }
        info["files"] = BEncodeValue{ std::move(files) };
    } else {
        info["length"] = BEncodeValue{ static_cast<int64_t>(meta.total_size) };
    }

    info["name"] = BEncodeValue{ meta.name };
    info["piece length"] = BEncodeValue{ static_cast<int64_t>(meta.piece_length) };

    std::string pieces;
    pieces.reserve(meta.piece_hashes.size() * 20);
    for (const auto& hash : meta.piece_hashes) {
        pieces.append(reinterpret_cast<const char*>(hash.data()), hash.size());
    }
    info["pieces"] = BEncodeValue{ std::move(pieces) };

    if (meta.is_private) info["private"] = BEncodeValue{ int64_t{ *meta.is_private ? 1 : 0 } };
    if (meta.source) info["source"] = BEncodeValue{ *meta.source };

    return BEncodeValue{ std::move(info) };
}

std::string encode_torrent(const TorrentMetadata& meta) {
    BEncodeValue::Dict dict;

    if (!meta.announce.empty()) dict["announce"] = BEncodeValue{ meta.announce };

    if (!meta.announce_list.empty()) {
        BEncodeValue::List tiers;
        for (const auto& tier : meta.announce_list) {
            BEncodeValue::List urls;
            for (const auto& url : tier) urls.push_back(BEncodeValue{ url });
            tiers.push_back(BEncodeValue{ std::move(urls) });
        }
        dict["announce-list"] = BEncodeValue{ std::move(tiers) };
    }

    if (meta.comment) dict["comment"] = BEncodeValue{ *meta.comment };
    if (meta.created_by) dict["created by"] = BEncodeValue{ *meta.created_by };
    if (meta.creation_date) dict["creation date"] = BEncodeValue{ static_cast<int64_t>(*meta.creation_date) };

    dict["info"] = info_dictionary(meta);

    return bencode(BEncodeValue{ std::move(dict) });
}

InfoHash info_hash(const TorrentMetadata& meta) {
    return sha1_digest(bencode(info_dictionary(meta)));
}

InfoHash raw_info_hash(const std::string& torrent_bytes) {
    BEncodeParser parser(torrent_bytes);
    parser.parse();
    if (!parser.has_info()) throw DecodeError("torrent has no info dictionary");

    const auto& [start, end] = parser.get_info_start_end();
    return sha1_digest(torrent_bytes.data() + start, end - start);
}

Sha1Digest sha1_digest(const void* data, size_t size) {
    Sha1Digest digest{};
    SHA1(reinterpret_cast<const unsigned char*>(data), size, digest.data());
    return digest;
}

std::string to_hex(const Sha1Digest& digest) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (auto b : digest) {
        out += hex[b >> 4];
        out += hex[b & 0x0f];
    }
    return out;
}

std::optional<InfoHash> info_hash_from_hex(const std::string& hex) {
    if (hex.size() != 40) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    InfoHash hash{};
    for (size_t i = 0; i < hash.size(); ++i) {
        int hi = nibble(hex[2 * i]), lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        hash[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return hash;
}

uint64_t piece_length_for_size(uint64_t total_size) {
    constexpr uint64_t MiB = 1024ull * 1024ull;

    // (upper bound of the size band, piece length)
    static constexpr std::pair<uint64_t, uint64_t> table[] = {
        { 64 * MiB,         32 * 1024 },
        { 128 * MiB,        64 * 1024 },
        { 256 * MiB,        128 * 1024 },
        { 512 * MiB,        256 * 1024 },
        { 1024 * MiB,       512 * 1024 },
        { 2 * 1024 * MiB,   1 * MiB },
        { 4 * 1024 * MiB,   2 * MiB },
        { 8 * 1024 * MiB,   4 * MiB },
        { 16 * 1024 * MiB,  8 * MiB },
    };

    for (const auto& [limit, piece] : table) {
        if (total_size <= limit) return piece;
    }
    return 16 * MiB;
}
