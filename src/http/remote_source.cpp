#include "uplift/http/remote_source.hpp"
#include "uplift/core/logger.hpp"
#include "uplift/core/utils.hpp"
#include <boost/beast/version.hpp>
#include <charconv>
#include <limits>

namespace uplift::http {

namespace beast_http = beast::http;

RemoteSource::RemoteSource(const std::string& url, std::optional<uint64_t> size_hint,
                           std::chrono::seconds timeout)
    : location_(url)
    , timeout_(timeout)
    , ssl_ctx_(make_client_context())
    , size_(size_hint)
{
    auto current = Url::parse(url);
    if (!current) {
        throw transfer::SourceError("Error opening " + url + ": not an http(s) URL");
    }

    for (int redirects = 0;; ++redirects) {
        try {
            open(*current);
        } catch (const beast::system_error& e) {
            throw transfer::SourceError("Error opening " + url + ": " + e.code().message());
        }

        auto status = static_cast<int>(parser_->get().result_int());
        auto location = parser_->get()[beast_http::field::location];
        if (!is_redirect(status) || location.empty()) {
            break;
        }
        if (redirects == MAX_REDIRECTS) {
            throw transfer::SourceError("Error opening " + url + ": stopped after " +
                                        std::to_string(MAX_REDIRECTS) + " redirects");
        }

        auto next = Url::parse(current->resolve(std::string(location.data(), location.size())));
        if (!next) {
            throw transfer::SourceError("Error opening " + url + ": unsupported redirect to '" +
                                        std::string(location.data(), location.size()) + "'");
        }
        LOG_DEBUG("GET {} redirected ({}) to {}", current->to_string(), status, next->to_string());
        current = next;
    }

    location_ = current->to_string();

    auto status = parser_->get().result_int();
    if (status != 200) {
        throw transfer::SourceError("Error opening " + url + ": HTTP status " + std::to_string(status));
    }

    if (auto length = parser_->content_length()) {
        size_ = *length;
    }

    LOG_INFO("Streaming {} ({} bytes)", location_, size_ ? std::to_string(*size_) : "unknown");
}

RemoteSource::~RemoteSource() = default;

void RemoteSource::open(const Url& url) {
    // A redirect response is abandoned along with its connection.
    parser_.reset();
    connection_.reset();
    connection_ = std::make_unique<Connection>(ssl_ctx_, url, timeout_);

    beast_http::request<beast_http::empty_body> req{beast_http::verb::get, url.target, 11};
    req.set(beast_http::field::host, url.authority());
    req.set(beast_http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.keep_alive(false);
    connection_->write(req);

    parser_ = std::make_unique<Parser>();
    parser_->body_limit(std::numeric_limits<std::uint64_t>::max());
    connection_->read_header(*parser_);
}

size_t RemoteSource::read(std::span<std::uint8_t> buffer) {
    if (buffer.empty() || parser_->is_done()) {
        return 0;
    }

    auto& body = parser_->get().body();
    body.data = buffer.data();
    body.size = buffer.size();

    beast::error_code ec;
    connection_->read(*parser_, ec);
    if (ec == beast_http::error::need_buffer) {
        ec = {};
    }
    if (ec) {
        throw transfer::SourceError("Error reading " + location_ + ": " + ec.message());
    }

    return buffer.size() - body.size;
}

std::optional<uint64_t> RemoteSource::advertised_length(Transport& transport, const std::string& url) {
    std::string current = url;
    Response response;

    for (int redirects = 0;; ++redirects) {
        Request head("HEAD", current);
        try {
            response = transport.round_trip(head);
        } catch (const TransportError& e) {
            throw transfer::SourceError("Error opening " + url + ": " + e.what());
        }

        auto location = response.header("Location");
        if (!is_redirect(response.status) || !location || location->empty()) {
            break;
        }
        if (redirects == MAX_REDIRECTS) {
            throw transfer::SourceError("Error opening " + url + ": stopped after " +
                                        std::to_string(MAX_REDIRECTS) + " redirects");
        }

        auto base = Url::parse(current);
        current = base ? base->resolve(*location) : *location;
        LOG_DEBUG("HEAD redirected ({}) to {}", response.status, current);
    }

    if (!response.ok()) {
        LOG_DEBUG("HEAD {} answered {}; length unknown until GET", current, response.status);
        return std::nullopt;
    }

    auto text = response.header("Content-Length");
    if (!text || text->empty()) {
        return std::nullopt;
    }

    uint64_t length = 0;
    auto [end, err] = std::from_chars(text->data(), text->data() + text->size(), length);
    if (err != std::errc() || end != text->data() + text->size()) {
        throw transfer::SourceError("Error opening " + url + ": invalid Content-Length '" + *text + "'");
    }

    return length;
}

bool RemoteSource::is_remote(const std::string& location) {
    auto lower = core::utils::StringUtils::to_lower(location);
    return core::utils::StringUtils::starts_with(lower, "http://") ||
           core::utils::StringUtils::starts_with(lower, "https://");
}

} // namespace uplift::http
