#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rproxy {

namespace events {
inline constexpr const char* kRateLimitExceeded = "rate_limit_exceeded";
inline constexpr const char* kMiddlewareError = "middleware_error";
inline constexpr const char* kNoRouteFound = "no_route_found";
inline constexpr const char* kNoBackendAvailable = "no_backend_available";
inline constexpr const char* kCacheHit = "cache_hit";
inline constexpr const char* kRequestForwarded = "request_forwarded";
inline constexpr const char* kProxyError = "proxy_error";
inline constexpr const char* kCircuitOpen = "circuit_open";
} // namespace events

// Snapshot of the request a lifecycle event refers to; owns its data so
// handlers may run after the request is gone.
struct Event {
    std::string type;
    std::chrono::system_clock::time_point timestamp;
    std::string method;
    std::string path;
    std::string client_ip;
    std::string backend;
    int status = 0;
    std::string error;
};

// Fire-and-forget fan-out. emit() only enqueues one task per subscriber;
// a small set of dispatcher threads runs them, so handlers of one event
// may run concurrently and never block the emitter.
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;

    explicit EventBus(size_t dispatchers = 2);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void subscribe(const std::string& type, Handler handler);

    void emit(Event event);

    size_t subscriber_count(const std::string& type) const;

    // Stop the dispatchers after the queue drains
    void shutdown();

private:
    void dispatch_loop(std::stop_token stop_token);

    mutable std::shared_mutex handlers_mutex_;
    std::unordered_map<std::string, std::vector<std::shared_ptr<const Handler>>> handlers_;

    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<std::function<void()>> queue_;

    std::vector<std::jthread> dispatchers_;
};

} // namespace rproxy
