#include <Release.hpp>
#include <Utils.hpp>

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

const std::regex season_episode_regex(R"(\bS(\d{2})E(\d{2,3}))", std::regex::icase);
const std::regex season_only_regex(R"(\bS(\d{2})\b)", std::regex::icase);
const std::regex boxset_regex(R"(\b(boxset|complete|collection)\b)", std::regex::icase);
const std::regex year_regex(R"(\b(19|20)\d{2}\b)");
const std::regex resolution_regex(R"((8640p|4320p|2160p|1440p|1080p|1080i|720p|576p|576i|480p|480i))", std::regex::icase);

const std::vector<std::string> strippable_extensions = {
    "mkv", "mp4", "m4b", "avi", "mov", "flv", "wmv", "ts",
    "epub", "mobi", "azw", "azw3", "pdf", "cbz", "cbr", "djvu", "fb2",
    "flac", "mp3", "m4a", "ogg", "opus", "wav"
};

std::string strip_extension(std::string_view name) {
    auto ext = file_extension(name);
    if (ext.empty() || std::find(strippable_extensions.begin(), strippable_extensions.end(), ext) == strippable_extensions.end())
        return std::string(name);
    return std::string(name.substr(0, name.size() - ext.size() - 1));
}

// scene names use dots or underscores for spaces
std::string spaced(std::string s) {
    std::replace(s.begin(), s.end(), '.', ' ');
    std::replace(s.begin(), s.end(), '_', ' ');
    return s;
}

std::string clean_title(const std::string& raw) {
    auto title = trim(spaced(raw));
    while (!title.empty() && (title.back() == '-' || title.back() == '(' || title.back() == '[' || title.back() == ' '))
        title.pop_back();
    return trim(title);
}

// a leading year is usually part of the title ("1917.2019.1080p")
std::optional<std::smatch> find_year(const std::string& s) {
    std::optional<std::smatch> first;
    for (auto it = std::sregex_iterator(s.begin(), s.end(), year_regex); it != std::sregex_iterator(); ++it) {
        if (it->position(0) > 0) return *it;
        if (!first) first = *it;
    }
    return first;
}

}

std::string content_type_name(ContentType type) {
    switch (type) {
        case ContentType::Movie:      return "movie";
        case ContentType::TVShow:     return "tv";
        case ContentType::Boxset:     return "boxset";
        case ContentType::MusicAlbum: return "music";
        case ContentType::EBook:      return "ebook";
        case ContentType::Other:      return "other";
    }
    return "other";
}

std::optional<ContentType> content_type_from_name(std::string_view name) {
    auto lowered = to_lower(name);
    if (lowered == "movie") return ContentType::Movie;
    if (lowered == "tv" || lowered == "tvshow") return ContentType::TVShow;
    if (lowered == "boxset") return ContentType::Boxset;
    if (lowered == "music" || lowered == "musicalbum") return ContentType::MusicAlbum;
    if (lowered == "ebook" || lowered == "book") return ContentType::EBook;
    if (lowered == "other") return ContentType::Other;
    return std::nullopt;
}

std::string file_extension(std::string_view path) {
    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash) || dot + 1 == path.size())
        return {};
    return to_lower(path.substr(dot + 1));
}

Release make_release(std::string name, std::vector<ReleaseFile> files, bool single_file, fs::path root) {
    Release release;
    release.root = std::move(root);
    release.name = std::move(name);
    release.single_file = single_file;

    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.path < b.path; });
    for (const auto& f : files) release.total_size += f.size;
    release.files = std::move(files);

    return release;
}

Release scan_release(const fs::path& root) {
    std::error_code ec;
    auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) throw std::runtime_error("Release path does not exist: " + root.string());

    auto name = root.filename().string();
    if (name.empty()) name = root.parent_path().filename().string();   // trailing slash

    std::vector<ReleaseFile> files;

    if (fs::is_regular_file(status)) {
        files.push_back({ name, static_cast<uint64_t>(fs::file_size(root)) });
        return make_release(name, std::move(files), true, root);
    }

    if (!fs::is_directory(status)) throw std::runtime_error("Release path is neither a file nor a directory: " + root.string());

    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        auto relative = fs::relative(entry.path(), root).generic_string();
        files.push_back({ relative, static_cast<uint64_t>(entry.file_size()) });
    }

    if (files.empty()) throw std::runtime_error("Release directory holds no files: " + root.string());

    return make_release(name, std::move(files), false, root);
}

std::optional<fs::path> find_release_nfo(const Release& release) {
    if (release.root.empty()) return std::nullopt;

    std::error_code ec;
    if (release.single_file) {
        auto sibling = release.root;
        sibling.replace_extension(".nfo");
        if (sibling != release.root && fs::is_regular_file(sibling, ec)) return sibling;
        return std::nullopt;
    }

    for (const auto& f : release.files) {
        if (f.path.find('/') != std::string::npos) continue;
        if (to_lower(fs::path(f.path).extension().string()) != ".nfo") continue;
        auto path = release.root / f.path;
        if (fs::is_regular_file(path, ec)) return path;
    }
    return std::nullopt;
}

std::string generate_release_name(std::string_view base_name) {
    static const std::regex video_extension(R"(\.(mkv|mp4|m4b|avi|mov|flv|wmv|ts)$)", std::regex::icase);
    static const std::regex unsafe(R"([^A-Za-z0-9+\-])");
    static const std::regex dot_runs(R"(\.\.+)");
    static const std::regex dot_dash(R"(-\.+|\.-+)");

    std::string name(base_name);
    name = std::regex_replace(name, video_extension, "");
    name = std::regex_replace(name, unsafe, ".");
    name = std::regex_replace(name, dot_runs, ".");
    name = std::regex_replace(name, dot_dash, "-");

    while (!name.empty() && name.back() == '.') name.pop_back();
    auto first = name.find_first_not_of('.');
    return first == std::string::npos ? std::string{} : name.substr(first);
}

ParsedName parse_release_name(std::string_view name, ContentType type) {
    ParsedName parsed;
    parsed.release_name = generate_release_name(name);

    auto base = strip_extension(name);

    std::smatch m;
    if (std::regex_search(base, m, resolution_regex)) parsed.resolution = to_lower(m.str(1));

    auto year_match = find_year(base);
    if (year_match) parsed.year = std::stoi(year_match->str(0));

    if (type == ContentType::EBook) {
        // "Author - Title (Year) [Format]"
        auto cut = base.find_first_of("([");
        std::string head = base.substr(0, cut);
        if (head.find(' ') == std::string::npos) head = spaced(head);

        auto dash = head.find(" - ");
        if (dash != std::string::npos) {
            parsed.author = trim(head.substr(0, dash));
            parsed.title = clean_title(head.substr(dash + 3));
        } else {
            parsed.title = clean_title(head);
        }
        if (parsed.title.empty()) parsed.title = clean_title(base);
        return parsed;
    }

    std::optional<size_t> title_end;

    if (std::regex_search(base, m, season_episode_regex)) {
        parsed.season = std::stoi(m.str(1));
        parsed.episode = std::stoi(m.str(2));
        title_end = m.position(0);
    } else if (std::regex_search(base, m, season_only_regex)) {
        parsed.season = std::stoi(m.str(1));
        title_end = m.position(0);
    } else if (std::regex_search(base, m, boxset_regex)) {
        title_end = m.position(0);
    }

    if (year_match) {
        auto year_pos = static_cast<size_t>(year_match->position(0));
        if (year_pos > 0 && (!title_end || year_pos < *title_end))
            title_end = year_pos;
    }

    parsed.title = clean_title(title_end ? base.substr(0, *title_end) : base);
    if (parsed.title.empty()) parsed.title = clean_title(base);

    return parsed;
}
