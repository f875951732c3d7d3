#include "uplift/http/connection.hpp"
#include "uplift/core/logger.hpp"
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace uplift::http {

ssl::context make_client_context() {
    ssl::context ctx{ssl::context::tls_client};
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
    return ctx;
}

Connection::Connection(ssl::context& ssl_ctx, const Url& url, std::chrono::seconds timeout)
    : timeout_(timeout)
{
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(url.host, std::to_string(url.port));

    if (url.secure()) {
        secure_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, ssl_ctx);

        if (!SSL_set_tlsext_host_name(secure_->native_handle(), url.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw beast::system_error(ec);
        }
        secure_->set_verify_callback(ssl::host_name_verification(url.host));

        run([&](auto&& handler) {
            beast::get_lowest_layer(*secure_).async_connect(results, std::move(handler));
        });
        run([&](auto&& handler) {
            secure_->async_handshake(ssl::stream_base::client, std::move(handler));
        });
    } else {
        plain_ = std::make_unique<beast::tcp_stream>(ioc_);
        run([&](auto&& handler) {
            plain_->async_connect(results, std::move(handler));
        });
    }

    LOG_DEBUG("Connected to {}:{}", url.host, url.port);
}

Connection::~Connection() {
    close();
}

beast::tcp_stream& Connection::lowest_layer() {
    if (secure_) {
        return beast::get_lowest_layer(*secure_);
    }
    return *plain_;
}

void Connection::close() {
    beast::error_code ec;

    if (secure_) {
        if (!interrupted_) {
            run([&](auto&& handler) { secure_->async_shutdown(std::move(handler)); }, ec);
            if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
                LOG_DEBUG("TLS shutdown notice: {}", ec.message());
            }
        }
        beast::get_lowest_layer(*secure_).socket().shutdown(tcp::socket::shutdown_both, ec);
        secure_.reset();
    }

    if (plain_) {
        plain_->socket().shutdown(tcp::socket::shutdown_both, ec);
        plain_.reset();
    }
}

} // namespace uplift::http
