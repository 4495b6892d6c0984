#pragma once

#include <httplib.h>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rproxy {

struct CacheEntry {
    int status = 200;
    httplib::Headers headers;
    std::string body;
    std::chrono::steady_clock::time_point expires;
};

// Backend-specific response store. Entries are never evicted; expired ones
// stay until overwritten or the whole store is cleared.
class ResponseCache {
public:
    using Clock = std::chrono::steady_clock;

    static std::string make_key(const std::string& method, const std::string& path,
                                const std::string& server_url);

    // Entry whose expiry is strictly in the future, std::nullopt otherwise
    std::optional<CacheEntry> get(const std::string& key) const;

    void put(const std::string& key, int status, httplib::Headers headers,
             std::string body, std::chrono::milliseconds ttl);

    void clear();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;
};

} // namespace rproxy
