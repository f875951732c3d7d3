#pragma once

#include "uplift/http/message.hpp"
#include <stdexcept>
#include <string>

namespace uplift::http {

// Network-level failure: resolve, connect, TLS, or a broken exchange.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A response arrived, but with a status the caller cannot continue from.
class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(int status, const std::string& message, std::string body = {})
        : std::runtime_error(message + " (HTTP " + std::to_string(status) + ")")
        , status_(status)
        , body_(std::move(body)) {}

    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    int status_;
    std::string body_;
};

// One request in, one response out. Implementations may wrap each other.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Response round_trip(Request& request) = 0;
};

} // namespace uplift::http
