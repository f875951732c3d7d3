#pragma once

#include "uplift/http/connection.hpp"
#include "uplift/http/transport.hpp"
#include "uplift/transfer/byte_source.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace uplift::http {

// Streams the body of an HTTP(S) GET as a ByteSource.
class RemoteSource : public transfer::ByteSource {
public:
    // Issues the GET, following up to MAX_REDIRECTS redirects, and reads the
    // final response header. The response's own Content-Length wins over
    // size_hint. Throws SourceError.
    explicit RemoteSource(const std::string& url, std::optional<uint64_t> size_hint = std::nullopt,
                          std::chrono::seconds timeout = Connection::DEFAULT_TIMEOUT);
    ~RemoteSource() override;

    size_t read(std::span<std::uint8_t> buffer) override;
    std::optional<uint64_t> size() const override { return size_; }

    // Where the body actually came from once redirects were followed.
    const std::string& location() const { return location_; }

    // HEAD request for the advertised Content-Length, following redirects.
    // Empty if the server does not say or answers the HEAD with an error;
    // the GET decides whether the source is usable.
    static std::optional<uint64_t> advertised_length(Transport& transport, const std::string& url);

    static bool is_remote(const std::string& location);

private:
    using Parser = beast::http::response_parser<beast::http::buffer_body>;

    std::string location_;
    std::chrono::seconds timeout_;
    ssl::context ssl_ctx_;
    std::unique_ptr<Connection> connection_;
    std::unique_ptr<Parser> parser_;
    std::optional<uint64_t> size_;

    void open(const Url& url);
};

} // namespace uplift::http
