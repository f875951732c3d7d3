#pragma once

#include "uplift/http/transport.hpp"
#include <memory>
#include <string>

namespace uplift::http {

class HttpClient {
public:
    explicit HttpClient(std::shared_ptr<Transport> transport);

    void set_access_token(const std::string& token) { access_token_ = token; }
    bool has_access_token() const { return !access_token_.empty(); }

    // Adds the Authorization header and sends the request. Non-2xx statuses
    // are returned, not thrown; TransportError and source errors propagate.
    Response send(Request& request);

    Transport& transport() { return *transport_; }

private:
    std::shared_ptr<Transport> transport_;
    std::string access_token_;
};

} // namespace uplift::http
