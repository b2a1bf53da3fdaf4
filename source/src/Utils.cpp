#include <Utils.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string read_from_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::string data(static_cast<size_t>(size), '\0');
    file.read(data.data(), size);
    if (!file) throw std::runtime_error("Short read from " + path);

    return data;
}

void write_to_file(const std::string& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + path);
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) throw std::runtime_error("Short write to " + path);
}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;

    std::string tmp = url;

    // strip scheme
    auto pos = tmp.find("://");
    if (pos != std::string::npos) {
        result.scheme = to_lower(tmp.substr(0, pos));
        tmp = tmp.substr(pos + 3);
    }
    if (result.scheme == "https") result.port = "443";

    // split host[:port] and path
    auto slash = tmp.find('/');
    std::string hostport = (slash != std::string::npos) ? tmp.substr(0, slash) : tmp;
    result.target = (slash != std::string::npos) ? tmp.substr(slash) : "/";

    // split host and port
    auto colon = hostport.find(':');
    if (colon != std::string::npos) {
        result.host = hostport.substr(0, colon);
        result.port = hostport.substr(colon + 1);
    } else {
        result.host = hostport;
    }

    return result;
}

std::string url_encode(std::string_view in) {
    std::ostringstream oss;
    for (unsigned char ch : in) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            oss << ch;
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(ch);
        }
    }
    return oss.str();
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) out += '&';
        out += url_encode(key);
        out += '=';
        out += url_encode(value);
    }
    return out;
}

std::string to_lower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view in) {
    auto first = in.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = in.find_last_not_of(" \t\r\n");
    return std::string(in.substr(first, last - first + 1));
}

std::string normalize_title(std::string_view in) {
    std::string out;
    bool pending_space = false;
    for (unsigned char ch : in) {
        if (std::isalnum(ch)) {
            if (pending_space && !out.empty()) out += ' ';
            pending_space = false;
            out += static_cast<char>(std::tolower(ch));
        } else if (ch == '\'') {
            continue;   // "Schindler's" == "Schindlers"
        } else {
            pending_space = true;
        }
    }
    return out;
}

size_t edit_distance(std::string_view a, std::string_view b) {
    std::vector<size_t> prev(b.size() + 1), curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({ prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost });
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

double title_similarity(std::string_view a, std::string_view b) {
    auto na = normalize_title(a);
    auto nb = normalize_title(b);
    auto longest = std::max(na.size(), nb.size());
    if (longest == 0) return 0.0;
    return 1.0 - static_cast<double>(edit_distance(na, nb)) / static_cast<double>(longest);
}
