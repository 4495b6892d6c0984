#pragma once

#include "errors.hpp"
#include <expected>
#include <string>
#include <cstdint>

namespace rproxy {

// Absolute http(s) URL of a backend server
struct Url {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string path;

    // "scheme://host:port", the form httplib::Client accepts
    std::string origin() const;

    // Canonical string form, used in cache keys and logs
    std::string to_string() const;

    static std::expected<Url, Error> parse(const std::string& raw);
};

} // namespace rproxy
