#include "request_utils.hpp"
#include <cctype>
#include <limits>

namespace rproxy {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// Decodes the UTF-8 code point starting at pos and advances past it.
// Malformed, overlong or surrogate sequences yield U+FFFD and consume one byte.
uint32_t next_code_point(const std::string& s, size_t& pos) {
    constexpr uint32_t kReplacement = 0xFFFD;
    const auto lead = static_cast<unsigned char>(s[pos]);
    if (lead < 0x80) {
        ++pos;
        return lead;
    }

    size_t length = 0;
    uint32_t code_point = 0;
    uint32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2; code_point = lead & 0x1F; minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; code_point = lead & 0x0F; minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; code_point = lead & 0x07; minimum = 0x10000;
    } else {
        ++pos;
        return kReplacement;
    }

    if (pos + length > s.size()) {
        ++pos;
        return kReplacement;
    }
    for (size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(s[pos + i]);
        if ((next & 0xC0) != 0x80) {
            ++pos;
            return kReplacement;
        }
        code_point = (code_point << 6) | (next & 0x3F);
    }
    if (code_point < minimum || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        ++pos;
        return kReplacement;
    }

    pos += length;
    return code_point;
}

} // namespace

std::string subdomain_of(const httplib::Request& req) {
    std::string host = req.get_header_value("Host");

    if (!host.empty() && host.front() == '[') {
        // IPv6 literal has no subdomain label
        size_t close = host.find(']');
        return host.substr(0, close == std::string::npos ? host.size() : close + 1);
    }

    size_t colon = host.find(':');
    if (colon != std::string::npos) {
        host = host.substr(0, colon);
    }
    return host.substr(0, host.find('.'));
}

std::string client_ip(const httplib::Request& req) {
    std::string forwarded = req.get_header_value("X-Forwarded-For");
    if (!forwarded.empty()) {
        return trim(forwarded.substr(0, forwarded.find(',')));
    }

    std::string real_ip = req.get_header_value("X-Real-IP");
    if (!real_ip.empty()) {
        return real_ip;
    }

    return req.remote_addr;
}

std::string cookie_value(const httplib::Request& req, const std::string& name) {
    if (name.empty()) return "";

    const std::string header = req.get_header_value("Cookie");
    size_t pos = 0;
    while (pos < header.size()) {
        size_t next = header.find(';', pos);
        if (next == std::string::npos) next = header.size();

        std::string part = trim(header.substr(pos, next - pos));
        size_t eq = part.find('=');
        if (eq != std::string::npos && trim(part.substr(0, eq)) == name) {
            return trim(part.substr(eq + 1));
        }

        pos = next + 1;
    }
    return "";
}

std::string routing_identifier(const httplib::Request& req) {
    std::string user_id = req.get_header_value("X-User-ID");
    if (user_id.empty()) {
        user_id = cookie_value(req, "user_id");
    }
    return user_id;
}

int64_t hash_string(const std::string& value) {
    // Unsigned arithmetic wraps the same way a 64-bit signed overflow would
    uint64_t hash = 0;
    size_t pos = 0;
    while (pos < value.size()) {
        hash = hash * 31 + next_code_point(value, pos);
    }
    auto result = static_cast<int64_t>(hash);
    if (result < 0) {
        // -INT64_MIN is not representable; it folds to zero
        result = result == std::numeric_limits<int64_t>::min() ? 0 : -result;
    }
    return result;
}

int bucket_of(const std::string& value) {
    return static_cast<int>(hash_string(value) % 100);
}

} // namespace rproxy
