#pragma once

#include "uplift/http/http_client.hpp"
#include "uplift/transfer/byte_source.hpp"
#include "uplift/upload/video_metadata.hpp"
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace uplift::upload {

// The server and the client disagree about the state of an upload.
class UploadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct UploadResult {
    std::string video_id;
    int status = 0;
    nlohmann::json resource;
    uint64_t bytes_sent = 0;
    uint32_t media_requests = 0;
};

// Resumable media upload.
//
// A small metadata POST opens an upload session; the media then goes up in
// PUT requests of at most chunk_size bytes, each tagged as payload and carrying
// a Content-Range. The server answers 308 while it wants more and 200/201
// with the created resource at the end. A source of unknown length is sent as
// one chunked-encoded PUT. Nothing is retried: the media stream cannot be
// rewound, so any disagreement about received bytes is an UploadError.
class MediaUploader {
public:
    MediaUploader(http::HttpClient& client, std::string endpoint, uint64_t chunk_size);

    UploadResult upload(const VideoMetadata& metadata,
                        std::shared_ptr<transfer::ByteSource> media,
                        const std::string& content_type = "video/*");

    uint64_t chunk_size() const { return chunk_size_; }

    static constexpr int STATUS_RESUME_INCOMPLETE = 308;

private:
    http::HttpClient& client_;
    std::string endpoint_;
    uint64_t chunk_size_;

    std::string start_session(const VideoMetadata& metadata, std::optional<uint64_t> size,
                              const std::string& content_type);
    http::Response send_chunk(const std::string& session_url,
                              const std::shared_ptr<transfer::ByteSource>& media,
                              uint64_t offset, uint64_t length, uint64_t total,
                              const std::string& content_type);

    static UploadResult finish(const http::Response& response);
    static std::optional<uint64_t> parse_range_end(const std::string& range);
};

} // namespace uplift::upload
