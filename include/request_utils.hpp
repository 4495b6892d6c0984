#pragma once

#include <httplib.h>
#include <cstdint>
#include <string>

namespace rproxy {

// First label of the Host header with any port stripped
std::string subdomain_of(const httplib::Request& req);

// First trimmed X-Forwarded-For entry, else X-Real-IP, else the transport address
std::string client_ip(const httplib::Request& req);

// Value of one cookie from the Cookie header, empty when absent
std::string cookie_value(const httplib::Request& req, const std::string& name);

// Sticky routing identity: X-User-ID header, else the user_id cookie, else ""
std::string routing_identifier(const httplib::Request& req);

// Base-31 polynomial hash over the Unicode code points of a UTF-8 string,
// folded to non-negative. Invalid bytes count as U+FFFD each.
int64_t hash_string(const std::string& value);

// hash_string(value) % 100
int bucket_of(const std::string& value);

} // namespace rproxy
