#include "uplift/upload/media_uploader.hpp"
#include "uplift/http/url.hpp"
#include "uplift/core/logger.hpp"
#include <algorithm>
#include <charconv>

namespace uplift::upload {

MediaUploader::MediaUploader(http::HttpClient& client, std::string endpoint, uint64_t chunk_size)
    : client_(client)
    , endpoint_(std::move(endpoint))
    , chunk_size_(chunk_size)
{
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

UploadResult MediaUploader::upload(const VideoMetadata& metadata,
                                   std::shared_ptr<transfer::ByteSource> media,
                                   const std::string& content_type) {
    if (!media) {
        throw std::invalid_argument("no media to upload");
    }

    auto total = media->size();
    auto session_url = start_session(metadata, total, content_type);

    if (!total) {
        http::Request request("PUT", session_url);
        request.set_header("Content-Type", content_type);
        request.set_body(media, std::nullopt);
        request.mark_payload();

        LOG_DEBUG("Uploading media of unknown length in one request");
        auto response = client_.send(request);
        if (response.status != 200 && response.status != 201) {
            throw http::HttpStatusError(response.status, "Error uploading media", response.body);
        }

        auto result = finish(response);
        result.media_requests = 1;
        return result;
    }

    uint64_t offset = 0;
    uint32_t requests = 0;

    while (true) {
        uint64_t length = std::min(chunk_size_, *total - offset);
        auto response = send_chunk(session_url, media, offset, length, *total, content_type);
        ++requests;

        if (response.status == 200 || response.status == 201) {
            auto result = finish(response);
            result.bytes_sent = offset + length;
            result.media_requests = requests;
            return result;
        }

        if (response.status != STATUS_RESUME_INCOMPLETE) {
            throw http::HttpStatusError(response.status, "Error uploading media", response.body);
        }

        // No Range header means the server has stored nothing yet.
        uint64_t acknowledged = 0;
        if (auto range = response.header("Range")) {
            auto end = parse_range_end(*range);
            if (!end) {
                throw UploadError("Unparseable Range header in upload response: " + *range);
            }
            acknowledged = *end + 1;
        }

        if (acknowledged != offset + length) {
            throw UploadError("Server holds " + std::to_string(acknowledged) + " bytes but " +
                              std::to_string(offset + length) + " were sent");
        }
        if (acknowledged >= *total) {
            throw UploadError("Server expects more than the declared " +
                              std::to_string(*total) + " bytes");
        }

        offset = acknowledged;
    }
}

std::string MediaUploader::start_session(const VideoMetadata& metadata, std::optional<uint64_t> size,
                                         const std::string& content_type) {
    http::Request request("POST", endpoint_);
    request.set_body(metadata.to_resource().dump(), "application/json; charset=UTF-8");
    request.set_header("X-Upload-Content-Type", content_type);
    if (size) {
        request.set_header("X-Upload-Content-Length", std::to_string(*size));
    }

    auto response = client_.send(request);
    if (!response.ok()) {
        throw http::HttpStatusError(response.status, "Error creating upload session", response.body);
    }

    auto location = response.header("Location");
    if (!location || location->empty()) {
        throw UploadError("Upload session response carries no Location");
    }

    auto endpoint_url = http::Url::parse(endpoint_);
    auto session_url = endpoint_url ? endpoint_url->resolve(*location) : *location;

    LOG_INFO("Upload session opened");
    LOG_DEBUG("Upload session URL: {}", session_url);
    return session_url;
}

http::Response MediaUploader::send_chunk(const std::string& session_url,
                                         const std::shared_ptr<transfer::ByteSource>& media,
                                         uint64_t offset, uint64_t length, uint64_t total,
                                         const std::string& content_type) {
    http::Request request("PUT", session_url);
    request.set_header("Content-Type", content_type);

    if (length == 0) {
        request.set_header("Content-Range", "bytes */" + std::to_string(total));
    } else {
        request.set_header("Content-Range", "bytes " + std::to_string(offset) + "-" +
                           std::to_string(offset + length - 1) + "/" + std::to_string(total));
    }

    request.set_body(std::make_shared<transfer::BoundedSource>(media, length), length);
    request.mark_payload();

    LOG_DEBUG("Sending media bytes {}-{} of {}", offset, offset + length, total);
    return client_.send(request);
}

UploadResult MediaUploader::finish(const http::Response& response) {
    UploadResult result;
    result.status = response.status;

    auto resource = nlohmann::json::parse(response.body, nullptr, false);
    if (resource.is_discarded() || !resource.is_object()) {
        LOG_WARN("Upload finished but the response body is not a JSON object");
        return result;
    }

    result.video_id = resource.value("id", std::string{});
    result.resource = std::move(resource);
    return result;
}

std::optional<uint64_t> MediaUploader::parse_range_end(const std::string& range) {
    // "bytes=0-1048575"
    auto dash = range.rfind('-');
    if (dash == std::string::npos || dash + 1 >= range.size()) {
        return std::nullopt;
    }

    uint64_t end = 0;
    const char* first = range.data() + dash + 1;
    const char* last = range.data() + range.size();
    auto [ptr, err] = std::from_chars(first, last, end);
    if (err != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return end;
}

} // namespace uplift::upload
