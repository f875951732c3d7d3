#pragma once

#include "uplift/http/connection.hpp"
#include "uplift/http/transport.hpp"
#include <chrono>
#include <string>

namespace uplift::http {

// Sends each request on a fresh connection using Boost.Beast. Request bodies
// are streamed from their ByteSource while the request is written.
class BeastTransport : public Transport {
public:
    BeastTransport();

    Response round_trip(Request& request) override;

    void set_user_agent(const std::string& user_agent) { user_agent_ = user_agent; }

    // Deadline for each connect, handshake, write and read step.
    void set_timeout(std::chrono::seconds timeout) { timeout_ = timeout; }
    std::chrono::seconds timeout() const { return timeout_; }

    static constexpr uint64_t RESPONSE_BODY_LIMIT = 16 * 1024 * 1024;

private:
    ssl::context ssl_ctx_;
    std::string user_agent_;
    std::chrono::seconds timeout_ = Connection::DEFAULT_TIMEOUT;
};

} // namespace uplift::http
