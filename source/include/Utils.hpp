#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <cstdint>

struct ParsedUrl {
    std::string scheme = "http";
    std::string host;
    std::string port = "80"; // default
    std::string target = "/";

    bool is_tls() const { return scheme == "https"; }
};

ParsedUrl parse_url(const std::string& url);

std::string read_from_file(const std::string& path);
void write_to_file(const std::string& path, const std::string& data);

// RFC 3986 unreserved characters pass through, everything else is %XX
std::string url_encode(std::string_view in);

// application/x-www-form-urlencoded body or query string
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);

std::string to_lower(std::string_view in);
std::string trim(std::string_view in);

// lowercase, punctuation folded to single spaces
std::string normalize_title(std::string_view in);

size_t edit_distance(std::string_view a, std::string_view b);

// 1.0 for identical normalized titles, falling towards 0.0 with edit distance
double title_similarity(std::string_view a, std::string_view b);
