#include "url.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace rproxy {

std::string Url::origin() const {
    if (host.find(':') != std::string::npos) {
        return fmt::format("{}://[{}]:{}", scheme, host, port);
    }
    return fmt::format("{}://{}:{}", scheme, host, port);
}

std::string Url::to_string() const {
    return origin() + path;
}

std::expected<Url, Error> Url::parse(const std::string& raw) {
    auto fail = [&raw](const std::string& why) {
        return std::unexpected(Error{ErrorCode::InvalidUrl,
            fmt::format("invalid server url '{}': {}", raw, why)});
    };

    size_t scheme_end = raw.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return fail("missing scheme");
    }

    Url url;
    url.scheme = raw.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return fail("unsupported scheme " + url.scheme);
    }

    std::string rest = raw.substr(scheme_end + 3);
    size_t path_start = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos && rest[path_start] == '/') {
        size_t path_end = rest.find_first_of("?#", path_start);
        url.path = rest.substr(path_start, path_end - path_start);
    }
    if (url.path == "/") {
        url.path.clear();
    }

    if (authority.find('@') != std::string::npos) {
        return fail("userinfo is not supported");
    }

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return fail("unterminated IPv6 literal");
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return fail("garbage after IPv6 literal");
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.find(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        return fail("missing host");
    }
    for (char c : url.host) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return fail("host contains whitespace");
        }
    }

    if (port_text.empty()) {
        url.port = url.scheme == "https" ? 443 : 80;
    } else {
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() ||
            port == 0 || port > 65535) {
            return fail("bad port " + port_text);
        }
        url.port = static_cast<uint16_t>(port);
    }

    return url;
}

} // namespace rproxy
