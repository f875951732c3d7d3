#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace uplift::upload {

class MetadataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Monetization {
    bool allowed = false;
    std::vector<std::string> excluded_regions;
};

struct VideoMetadata {
    std::string title;
    std::string description;
    std::string category_id;
    std::string privacy_status;
    std::vector<std::string> tags;
    Monetization monetization;

    // Throws MetadataError if the file cannot be read or parsed.
    static VideoMetadata from_json_file(const std::filesystem::path& path);

    // Fills every field still empty from the command-line values.
    void apply_fallbacks(const VideoMetadata& flags);

    // Request body for creating the video resource.
    nlohmann::json to_resource() const;

    // Comma separated list, blanks dropped.
    static std::vector<std::string> parse_tags(const std::string& text);
};

// Metadata file layout: title, description, categoryId, privacyStatus, tags,
// monetization { allowed, excluded_regions }.
void from_json(const nlohmann::json& j, Monetization& monetization);
void from_json(const nlohmann::json& j, VideoMetadata& metadata);

} // namespace uplift::upload
