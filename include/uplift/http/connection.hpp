#pragma once

#include "uplift/http/url.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <memory>
#include <utility>

namespace uplift::http {

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// TLS client context that verifies peers against the system trust store.
ssl::context make_client_context();

// One connection to the origin of a URL, plain or TLS, with blocking calls.
// Connects (and handshakes) on construction. Every step runs as an
// asynchronous operation on a private io_context with a deadline of
// `timeout`, so a stalled peer fails the call with beast::error::timeout.
// Errors are thrown as beast::system_error.
class Connection {
public:
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

    Connection(ssl::context& ssl_ctx, const Url& url, std::chrono::seconds timeout = DEFAULT_TIMEOUT);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Serialized one buffer at a time; the deadline restarts per buffer so a
    // throttled body can take as long as it needs.
    template<bool isRequest, class Body, class Fields>
    void write(const beast::http::message<isRequest, Body, Fields>& message) {
        beast::http::serializer<isRequest, Body, Fields> serializer{message};
        while (!serializer.is_done()) {
            run([&](auto&& handler) {
                with_stream([&](auto& stream) {
                    beast::http::async_write_some(stream, serializer, std::move(handler));
                });
            });
        }
    }

    template<class Parser>
    void read_header(Parser& parser) {
        run([&](auto&& handler) {
            with_stream([&](auto& stream) {
                beast::http::async_read_header(stream, buffer_, parser, std::move(handler));
            });
        });
    }

    template<class Parser>
    void read(Parser& parser) {
        beast::error_code ec;
        read(parser, ec);
        if (ec) {
            throw beast::system_error(ec);
        }
    }

    template<class Parser>
    void read(Parser& parser, beast::error_code& ec) {
        run([&](auto&& handler) {
            with_stream([&](auto& stream) {
                beast::http::async_read(stream, buffer_, parser, std::move(handler));
            });
        }, ec);
    }

    void close();

private:
    // Declared first so pending handlers outlive the streams that own them.
    net::io_context ioc_;
    std::chrono::seconds timeout_;
    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> secure_;
    beast::flat_buffer buffer_;
    // Set while an operation is in flight; stays set if one was abandoned by
    // an exception, after which the io_context must not run again.
    bool interrupted_ = false;

    beast::tcp_stream& lowest_layer();

    template<class Initiate>
    void run(Initiate&& initiate, beast::error_code& ec) {
        if (interrupted_ || (!plain_ && !secure_)) {
            ec = net::error::make_error_code(net::error::not_connected);
            return;
        }

        bool finished = false;
        auto handler = [&ec, &finished](beast::error_code result, auto&&...) {
            ec = result;
            finished = true;
        };

        interrupted_ = true;
        lowest_layer().expires_after(timeout_);
        initiate(handler);
        ioc_.restart();
        ioc_.run();
        interrupted_ = false;

        if (!finished) {
            ec = net::error::make_error_code(net::error::operation_aborted);
        }
    }

    template<class Initiate>
    void run(Initiate&& initiate) {
        beast::error_code ec;
        run(std::forward<Initiate>(initiate), ec);
        if (ec) {
            throw beast::system_error(ec);
        }
    }

    template<class F>
    void with_stream(F&& f) {
        if (secure_) {
            f(*secure_);
        } else {
            f(*plain_);
        }
    }
};

} // namespace uplift::http
