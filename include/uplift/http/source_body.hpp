#pragma once

#include "uplift/transfer/byte_source.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/optional.hpp>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace uplift::http {

// Beast Body that serializes a ByteSource. The stream is pulled one buffer at
// a time while the message is written, so a throttled source paces the socket.
// Errors thrown by the source escape http::write unchanged.
struct SourceBody {
    using value_type = std::shared_ptr<transfer::ByteSource>;

    static constexpr size_t BUFFER_SIZE = 64 * 1024;

    class writer {
    public:
        using const_buffers_type = boost::asio::const_buffer;

        template<bool isRequest, class Fields>
        writer(const boost::beast::http::header<isRequest, Fields>&, const value_type& body)
            : body_(body) {}

        void init(boost::beast::error_code& ec) {
            buffer_.resize(BUFFER_SIZE);
            ec = {};
        }

        boost::optional<std::pair<const_buffers_type, bool>> get(boost::beast::error_code& ec) {
            ec = {};
            if (!body_) {
                return boost::none;
            }

            size_t n = body_->read(std::span<std::uint8_t>(buffer_.data(), buffer_.size()));
            if (n == 0) {
                return boost::none;
            }

            return std::make_pair(const_buffers_type(buffer_.data(), n), true);
        }

    private:
        value_type body_;
        std::vector<std::uint8_t> buffer_;
    };
};

} // namespace uplift::http
