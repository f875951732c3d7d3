#include "uplift/http/url.hpp"
#include "uplift/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace uplift::http {

using core::utils::StringUtils;

std::optional<Url> Url::parse(const std::string& text) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    Url url;
    url.scheme = StringUtils::to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return std::nullopt;
    }

    auto rest = text.substr(scheme_end + 3);
    auto target_start = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, target_start);
    url.target = target_start == std::string::npos ? "/" : rest.substr(target_start);

    auto fragment = url.target.find('#');
    if (fragment != std::string::npos) {
        url.target.erase(fragment);
    }
    if (url.target.empty() || url.target.front() != '/') {
        url.target.insert(url.target.begin(), '/');
    }

    // userinfo is not supported
    if (authority.empty() || authority.find('@') != std::string::npos) {
        return std::nullopt;
    }

    url.port = url.secure() ? 443 : 80;

    std::string port_text;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return std::nullopt;
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        return std::nullopt;
    }

    if (!port_text.empty()) {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        auto port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return std::nullopt;
        }
        url.port = static_cast<std::uint16_t>(port);
    }

    return url;
}

std::string Url::authority() const {
    std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (default_port()) {
        return host_part;
    }
    return host_part + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    return scheme + "://" + authority() + target;
}

std::string Url::resolve(const std::string& location) const {
    if (location.find("://") != std::string::npos) {
        return location;
    }
    if (StringUtils::starts_with(location, "/")) {
        return scheme + "://" + authority() + location;
    }

    auto query = target.find('?');
    auto path = target.substr(0, query);
    auto slash = path.rfind('/');
    return scheme + "://" + authority() + path.substr(0, slash + 1) + location;
}

} // namespace uplift::http
