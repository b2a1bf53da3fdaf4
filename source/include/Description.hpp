#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <Identity.hpp>
#include <Release.hpp>

struct DescriptionInput {
    ContentType type = ContentType::Other;
    IdentitySet identities;
    std::vector<std::string> screenshot_urls;
    std::optional<std::string> sample_url;
    std::optional<std::string> custom_description;
};

// BBCode body for upload forms. Unresolved identifiers are left out entirely.
std::string build_description(const DescriptionInput& input);

// local artifact path -> public URL under base_url
std::string published_url(const std::string& base_url, const std::filesystem::path& artifact);
