#pragma once

#include "uplift/transfer/byte_source.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace uplift::http {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

class Request {
public:
    Request(std::string method, std::string url);

    const std::string& method() const { return method_; }
    const std::string& url() const { return url_; }

    void set_header(const std::string& name, const std::string& value);
    std::optional<std::string> header(const std::string& name) const;
    const Headers& headers() const { return headers_; }

    // A body without a length is sent with chunked transfer encoding.
    void set_body(std::shared_ptr<transfer::ByteSource> body, std::optional<uint64_t> content_length);
    void set_body(const std::string& text, const std::string& content_type);

    // Swaps the body stream while keeping the declared length.
    void replace_body(std::shared_ptr<transfer::ByteSource> body);

    const std::shared_ptr<transfer::ByteSource>& body() const { return body_; }
    std::optional<uint64_t> content_length() const { return content_length_; }

    // Tags this request as the one carrying the transfer's payload; only
    // tagged requests are throttled and measured.
    void mark_payload() { payload_ = true; }
    bool is_payload() const { return payload_; }

private:
    std::string method_;
    std::string url_;
    Headers headers_;
    std::shared_ptr<transfer::ByteSource> body_;
    std::optional<uint64_t> content_length_;
    bool payload_ = false;
};

struct Response {
    int status = 0;
    std::string reason;
    Headers headers;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
    std::optional<std::string> header(const std::string& name) const;
};

// 301, 302, 303, 307 and 308: the Location header names where to go next.
bool is_redirect(int status);

// Hops followed before a download gives up.
constexpr int MAX_REDIRECTS = 10;

} // namespace uplift::http
