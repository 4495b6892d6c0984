#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace rproxy {

// Token bucket per identifier. Buckets are created full on first sight and
// refilled lazily on access at max_requests/window tokens per second.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(int max_requests, std::chrono::milliseconds window);

    // Consume one token for identifier
    bool allow(const std::string& identifier);

    // Same as allow() with an explicit clock reading
    bool allow_at(const std::string& identifier, Clock::time_point now);

    int max_requests() const { return max_requests_; }
    std::chrono::milliseconds window() const { return window_; }

    size_t bucket_count() const;

private:
    struct Bucket {
        double tokens;
        Clock::time_point last_touch;
    };

    int max_requests_;
    std::chrono::milliseconds window_;
    double refill_per_second_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
};

// Independent limiters per tenant; tenants without a limit are never throttled
class TenantRateLimiter {
public:
    void set_tenant_limit(const std::string& tenant_id, int max_requests, std::chrono::milliseconds window);

    bool check(const std::string& tenant_id, const std::string& identifier);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<RateLimiter>> tenant_limits_;
};

} // namespace rproxy
