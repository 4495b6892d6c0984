#pragma once

#include "backend_pool.hpp"
#include "circuit_breaker.hpp"
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "middleware.hpp"
#include "rate_limiter.hpp"
#include "response_cache.hpp"
#include "router.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace rproxy {

struct ProxyStats {
    int64_t request_count = 0;
    int64_t error_count = 0;
    size_t cache_size = 0;
};

void to_json(nlohmann::json& j, const ProxyStats& stats);

// Per-request pipeline:
//   rate limit (429) -> middleware chain (403) -> route match (404)
//   -> server selection (503) -> cache lookup -> forward (502)
// Every short circuit emits its lifecycle event on the bus.
class ProxyEngine {
public:
    ProxyEngine();

    ProxyEngine(const ProxyEngine&) = delete;
    ProxyEngine& operator=(const ProxyEngine&) = delete;

    Router& router() { return router_; }

    std::expected<void, Error> add_route(Route route);

    ProxyEngine& add_middleware(Middleware middleware);

    // Replaces the limiter and forgets every bucket
    void set_rate_limit(int max_requests, std::chrono::milliseconds window);

    void set_cache_policy(const CachePolicyConfig& policy);

    // Per-server breakers in the forward path; replaces existing breakers
    void set_circuit_breaker_policy(const CircuitBreakerPolicy& policy);

    void set_upstream_timeout(std::chrono::milliseconds timeout);

    void handle(const httplib::Request& req, httplib::Response& res);

    void cache_response(const httplib::Request& req, const Server& server, int status,
                        httplib::Headers headers, std::string body, std::chrono::milliseconds ttl);

    void clear_cache();

    ProxyStats get_stats() const;

    void on(const std::string& event_type, EventBus::Handler handler);

    // nullptr while circuit breaking is disabled
    std::shared_ptr<CircuitBreaker> breaker_for(const Server& server);

private:
    struct Settings {
        std::shared_ptr<RateLimiter> rate_limiter;
        std::shared_ptr<const MiddlewareChain> middlewares;
        CachePolicyConfig cache;
        CircuitBreakerPolicy breaker;
        std::chrono::milliseconds upstream_timeout{30000};
    };

    Settings settings() const;

    void forward_request(const httplib::Request& req, httplib::Response& res,
                         const Server& server, const Settings& settings);

    static void serve_cached(const CacheEntry& entry, httplib::Response& res);

    void reject(httplib::Response& res, int status, const std::string& message);

    void emit(const char* type, const httplib::Request& req, int status = 0,
              std::string error = {}, std::string backend = {});

    Router router_;
    ResponseCache cache_;

    mutable std::shared_mutex settings_mutex_;
    Settings settings_;

    std::mutex breakers_mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;

    std::atomic<int64_t> request_count_{0};
    std::atomic<int64_t> error_count_{0};

    // Last member: dispatchers stop before anything they might touch
    EventBus events_;
};

} // namespace rproxy
