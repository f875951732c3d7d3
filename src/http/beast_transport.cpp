#include "uplift/http/beast_transport.hpp"
#include "uplift/http/source_body.hpp"
#include "uplift/core/logger.hpp"
#include "uplift/core/utils.hpp"
#include <boost/beast/version.hpp>

namespace uplift::http {

namespace beast_http = beast::http;

BeastTransport::BeastTransport()
    : ssl_ctx_(make_client_context())
    , user_agent_(std::string("uplift/") + UPLIFT_VERSION + " " + BOOST_BEAST_VERSION_STRING) {
}

Response BeastTransport::round_trip(Request& request) {
    auto url = Url::parse(request.url());
    if (!url) {
        throw TransportError("Invalid URL: " + request.url());
    }

    bool is_head = core::utils::StringUtils::iequals(request.method(), "HEAD");

    try {
        Connection connection(ssl_ctx_, *url, timeout_);

        beast_http::request<SourceBody> req;
        req.method_string(request.method());
        req.target(url->target);
        req.version(11);
        req.set(beast_http::field::host, url->authority());
        req.set(beast_http::field::user_agent, user_agent_);
        for (const auto& [name, value] : request.headers()) {
            req.set(name, value);
        }
        req.keep_alive(false);

        req.body() = request.body();
        if (request.content_length()) {
            req.content_length(*request.content_length());
        } else if (request.body()) {
            req.chunked(true);
        }

        LOG_DEBUG("{} {} (body: {})", request.method(), url->to_string(),
                  request.content_length() ? std::to_string(*request.content_length()) : "streamed");

        connection.write(req);

        beast_http::response_parser<beast_http::string_body> parser;
        parser.body_limit(RESPONSE_BODY_LIMIT);
        if (is_head) {
            parser.skip(true);
        }
        connection.read(parser);
        connection.close();

        auto res = parser.release();

        Response response;
        response.status = static_cast<int>(res.result_int());
        auto reason = res.reason();
        response.reason.assign(reason.data(), reason.size());
        for (const auto& field : res) {
            auto name = field.name_string();
            auto value = field.value();
            response.headers[std::string(name.data(), name.size())] = std::string(value.data(), value.size());
        }
        response.body = std::move(res.body());

        LOG_DEBUG("{} {} -> {}", request.method(), url->to_string(), response.status);
        return response;
    } catch (const beast::system_error& e) {
        throw TransportError(request.method() + " " + url->to_string() + ": " + e.code().message());
    }
}

} // namespace uplift::http
