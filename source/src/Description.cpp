#include <Description.hpp>

#include <sstream>

namespace {

void append_screenshots(std::ostringstream& out, const std::vector<std::string>& urls) {
    if (urls.empty()) return;

    // two per row
    out << "[center][table][tr]\n";
    for (size_t i = 0; i < urls.size(); ++i) {
        out << "    [td][url=" << urls[i] << "][img width=720]" << urls[i] << "[/img][/url][/td]\n";
        if ((i + 1) % 2 == 0 && i + 1 < urls.size()) out << "[/tr][tr]\n";
    }
    out << "[/tr][/table][/center]\n\n";
}

void append_links(std::ostringstream& out, ContentType type, const IdentitySet& ids) {
    std::vector<std::string> links;
    if (ids.tmdb) {
        auto kind = (type == ContentType::Movie) ? "movie" : "tv";
        links.push_back("[url=https://www.themoviedb.org/" + std::string(kind) + "/" + ids.tmdb->value + "]TMDB[/url]");
    }
    if (ids.imdb) links.push_back("[url=https://www.imdb.com/title/" + ids.imdb->value + "/]IMDb[/url]");
    if (ids.tvdb) links.push_back("[url=https://thetvdb.com/dereferrer/series/" + ids.tvdb->value + "]TVDB[/url]");
    if (ids.open_library) links.push_back("[url=https://openlibrary.org/works/" + ids.open_library->value + "]Open Library[/url]");

    if (links.empty()) return;

    out << "[center]";
    for (size_t i = 0; i < links.size(); ++i) out << (i ? " | " : "") << links[i];
    out << "[/center]\n\n";
}

void append_book(std::ostringstream& out, const BookDetails& book) {
    out << "[b]" << book.title << "[/b]";
    if (!book.authors.empty()) {
        out << " by ";
        for (size_t i = 0; i < book.authors.size(); ++i) out << (i ? ", " : "") << book.authors[i];
    }
    if (book.first_publish_year) out << " (" << *book.first_publish_year << ")";
    out << "\n\n";

    if (book.cover_url) out << "[img width=300]" << *book.cover_url << "[/img]\n\n";
    if (book.description) out << *book.description << "\n\n";
}

}

std::string build_description(const DescriptionInput& input) {
    std::ostringstream out;

    append_screenshots(out, input.screenshot_urls);

    if (input.sample_url) {
        auto file_name = std::filesystem::path(*input.sample_url).filename().string();
        out << "[b][spoiler=Sample: " << file_name << "]" << *input.sample_url << "[/spoiler][/b]\n\n";
    }

    if (input.identities.book) append_book(out, *input.identities.book);

    append_links(out, input.type, input.identities);

    if (input.custom_description && !input.custom_description->empty()) out << *input.custom_description << "\n\n";

    out << "[size=12][color=#757575]Created with ffmpeg and mediainfo. Posted with seed-tools.[/color][/size]";
    return out.str();
}

std::string published_url(const std::string& base_url, const std::filesystem::path& artifact) {
    return base_url + "/" + artifact.filename().string();
}
