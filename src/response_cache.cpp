#include "response_cache.hpp"

namespace rproxy {

std::string ResponseCache::make_key(const std::string& method, const std::string& path,
                                    const std::string& server_url) {
    return method + ":" + path + ":" + server_url;
}

std::optional<CacheEntry> ResponseCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.expires <= Clock::now()) {
        return std::nullopt;
    }
    return it->second;
}

void ResponseCache::put(const std::string& key, int status, httplib::Headers headers,
                        std::string body, std::chrono::milliseconds ttl) {
    CacheEntry entry{status, std::move(headers), std::move(body), Clock::now() + ttl};
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(entry);
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace rproxy
