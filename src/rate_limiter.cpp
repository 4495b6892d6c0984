#include "rate_limiter.hpp"
#include <algorithm>

namespace rproxy {

RateLimiter::RateLimiter(int max_requests, std::chrono::milliseconds window)
    : max_requests_(max_requests), window_(window) {
    const double window_seconds = std::chrono::duration<double>(window_).count();
    refill_per_second_ = window_seconds > 0.0 ? max_requests_ / window_seconds : 0.0;
}

bool RateLimiter::allow(const std::string& identifier) {
    return allow_at(identifier, Clock::now());
}

bool RateLimiter::allow_at(const std::string& identifier, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(identifier);
    if (it == buckets_.end()) {
        buckets_.emplace(identifier, Bucket{static_cast<double>(max_requests_), now});
        return true;
    }

    Bucket& bucket = it->second;
    if (now > bucket.last_touch) {
        const double elapsed = std::chrono::duration<double>(now - bucket.last_touch).count();
        bucket.tokens = std::min(static_cast<double>(max_requests_),
                                 bucket.tokens + elapsed * refill_per_second_);
    }
    bucket.last_touch = now;

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return true;
    }
    return false;
}

size_t RateLimiter::bucket_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

void TenantRateLimiter::set_tenant_limit(const std::string& tenant_id, int max_requests,
                                         std::chrono::milliseconds window) {
    auto limiter = std::make_shared<RateLimiter>(max_requests, window);
    std::unique_lock lock(mutex_);
    tenant_limits_[tenant_id] = std::move(limiter);
}

bool TenantRateLimiter::check(const std::string& tenant_id, const std::string& identifier) {
    std::shared_ptr<RateLimiter> limiter;
    {
        std::shared_lock lock(mutex_);
        auto it = tenant_limits_.find(tenant_id);
        if (it == tenant_limits_.end()) {
            return true;
        }
        limiter = it->second;
    }
    return limiter->allow(identifier);
}

} // namespace rproxy
