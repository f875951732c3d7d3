#include "uplift/upload/video_metadata.hpp"
#include "uplift/core/utils.hpp"

namespace uplift::upload {

using core::utils::StringUtils;

void from_json(const nlohmann::json& j, Monetization& monetization) {
    monetization.allowed = j.value("allowed", false);
    monetization.excluded_regions = j.value("excluded_regions", std::vector<std::string>{});
}

void from_json(const nlohmann::json& j, VideoMetadata& metadata) {
    metadata.title = j.value("title", std::string{});
    metadata.description = j.value("description", std::string{});
    metadata.category_id = j.value("categoryId", std::string{});
    metadata.privacy_status = j.value("privacyStatus", std::string{});
    metadata.tags = j.value("tags", std::vector<std::string>{});
    if (j.contains("monetization") && j["monetization"].is_object()) {
        metadata.monetization = j["monetization"].get<Monetization>();
    }
}

VideoMetadata VideoMetadata::from_json_file(const std::filesystem::path& path) {
    auto content = core::utils::FileUtils::read_file(path);
    if (!content) {
        throw MetadataError("Could not read metaJSON file '" + path.string() + "'");
    }

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object()) {
            throw MetadataError("metaJSON file '" + path.string() + "' is not a JSON object");
        }
        return j.get<VideoMetadata>();
    } catch (const nlohmann::json::exception& e) {
        throw MetadataError("Could not read metaJSON file '" + path.string() + "': " + e.what());
    }
}

void VideoMetadata::apply_fallbacks(const VideoMetadata& flags) {
    if (title.empty()) title = flags.title;
    if (description.empty()) description = flags.description;
    if (category_id.empty()) category_id = flags.category_id;
    if (privacy_status.empty()) privacy_status = flags.privacy_status;
    if (tags.empty()) tags = flags.tags;
}

nlohmann::json VideoMetadata::to_resource() const {
    nlohmann::json snippet = {
        {"title", title},
        {"description", description}
    };
    if (!tags.empty()) {
        snippet["tags"] = tags;
    }
    if (!category_id.empty()) {
        snippet["categoryId"] = category_id;
    }

    nlohmann::json resource = {
        {"snippet", snippet},
        {"status", {{"privacyStatus", privacy_status}}}
    };

    if (monetization.allowed) {
        resource["monetizationDetails"] = {
            {"access", {
                {"allowed", true},
                {"exception", monetization.excluded_regions}
            }}
        };
    }

    return resource;
}

std::vector<std::string> VideoMetadata::parse_tags(const std::string& text) {
    std::vector<std::string> tags;
    for (const auto& part : StringUtils::split(text, ',')) {
        auto tag = StringUtils::trim(part);
        if (!tag.empty()) {
            tags.push_back(tag);
        }
    }
    return tags;
}

} // namespace uplift::upload
