#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace uplift::http {

struct Url {
    std::string scheme;     // "http" or "https", lower case
    std::string host;
    std::uint16_t port = 0;
    std::string target;     // path plus query, at least "/"

    static std::optional<Url> parse(const std::string& text);

    bool secure() const { return scheme == "https"; }
    bool default_port() const { return port == (secure() ? 443 : 80); }

    // Value for the Host header: the port is left out when it is the default.
    std::string authority() const;
    std::string to_string() const;

    // Absolute URL for a Location value that may be relative to this one.
    std::string resolve(const std::string& location) const;
};

} // namespace uplift::http
