#include "uplift/http/message.hpp"
#include <algorithm>
#include <cctype>

namespace uplift::http {

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

Request::Request(std::string method, std::string url)
    : method_(std::move(method))
    , url_(std::move(url)) {
}

void Request::set_header(const std::string& name, const std::string& value) {
    headers_[name] = value;
}

std::optional<std::string> Request::header(const std::string& name) const {
    auto it = headers_.find(name);
    if (it != headers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void Request::set_body(std::shared_ptr<transfer::ByteSource> body, std::optional<uint64_t> content_length) {
    body_ = std::move(body);
    content_length_ = content_length;
}

void Request::set_body(const std::string& text, const std::string& content_type) {
    body_ = std::make_shared<transfer::MemorySource>(text);
    content_length_ = text.size();
    set_header("Content-Type", content_type);
}

void Request::replace_body(std::shared_ptr<transfer::ByteSource> body) {
    body_ = std::move(body);
}

std::optional<std::string> Response::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool is_redirect(int status) {
    switch (status) {
    case 301:
    case 302:
    case 303:
    case 307:
    case 308:
        return true;
    default:
        return false;
    }
}

} // namespace uplift::http
