#include "uplift/http/http_client.hpp"

namespace uplift::http {

HttpClient::HttpClient(std::shared_ptr<Transport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("HttpClient requires a transport");
    }
}

Response HttpClient::send(Request& request) {
    if (!access_token_.empty() && !request.header("Authorization")) {
        request.set_header("Authorization", "Bearer " + access_token_);
    }

    return transport_->round_trip(request);
}

} // namespace uplift::http
