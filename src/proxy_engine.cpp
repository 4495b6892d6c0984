#include "proxy_engine.hpp"
#include "logger.hpp"
#include "request_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace rproxy {

namespace {

constexpr int kDefaultMaxRequests = 1000;
constexpr std::chrono::minutes kDefaultWindow{1};

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
}

// Connection-level headers plus the ones the proxy rewrites or recomputes.
// REMOTE_ADDR and friends are pseudo headers httplib::Server adds on receipt.
constexpr std::array<std::string_view, 16> kRequestHeadersToDrop = {
    "Connection", "Keep-Alive", "Proxy-Connection", "Transfer-Encoding", "TE", "Trailer",
    "Upgrade", "Proxy-Authorization", "Content-Length", "X-Forwarded-For",
    "X-Forwarded-Proto", "X-Real-IP", "REMOTE_ADDR", "REMOTE_PORT", "LOCAL_ADDR", "LOCAL_PORT"
};

constexpr std::array<std::string_view, 8> kResponseHeadersToDrop = {
    "Connection", "Keep-Alive", "Proxy-Connection", "Transfer-Encoding", "TE", "Trailer",
    "Upgrade", "Content-Length"
};

template <size_t N>
bool in_list(const std::array<std::string_view, N>& list, const std::string& name) {
    return std::any_of(list.begin(), list.end(),
        [&name](std::string_view dropped) { return iequals(dropped, name); });
}

httplib::Headers filter_response_headers(const httplib::Headers& headers) {
    httplib::Headers result;
    for (const auto& [key, value] : headers) {
        if (!in_list(kResponseHeadersToDrop, key)) {
            result.emplace(key, value);
        }
    }
    return result;
}

} // namespace

void to_json(nlohmann::json& j, const ProxyStats& stats) {
    j = nlohmann::json{
        {"request_count", stats.request_count},
        {"error_count", stats.error_count},
        {"cache_size", stats.cache_size}
    };
}

ProxyEngine::ProxyEngine() {
    settings_.rate_limiter = std::make_shared<RateLimiter>(kDefaultMaxRequests, kDefaultWindow);
    settings_.middlewares = std::make_shared<const MiddlewareChain>();
}

std::expected<void, Error> ProxyEngine::add_route(Route route) {
    return router_.add_route(std::move(route));
}

ProxyEngine& ProxyEngine::add_middleware(Middleware middleware) {
    std::unique_lock lock(settings_mutex_);
    auto chain = std::make_shared<MiddlewareChain>(*settings_.middlewares);
    chain->add(std::move(middleware));
    settings_.middlewares = std::move(chain);
    return *this;
}

void ProxyEngine::set_rate_limit(int max_requests, std::chrono::milliseconds window) {
    auto limiter = std::make_shared<RateLimiter>(max_requests, window);
    std::unique_lock lock(settings_mutex_);
    settings_.rate_limiter = std::move(limiter);
}

void ProxyEngine::set_cache_policy(const CachePolicyConfig& policy) {
    std::unique_lock lock(settings_mutex_);
    settings_.cache = policy;
}

void ProxyEngine::set_circuit_breaker_policy(const CircuitBreakerPolicy& policy) {
    {
        std::unique_lock lock(settings_mutex_);
        settings_.breaker = policy;
    }
    std::lock_guard<std::mutex> lock(breakers_mutex_);
    breakers_.clear();
}

void ProxyEngine::set_upstream_timeout(std::chrono::milliseconds timeout) {
    std::unique_lock lock(settings_mutex_);
    settings_.upstream_timeout = timeout;
}

ProxyEngine::Settings ProxyEngine::settings() const {
    std::shared_lock lock(settings_mutex_);
    return settings_;
}

void ProxyEngine::handle(const httplib::Request& req, httplib::Response& res) {
    request_count_.fetch_add(1);
    const Settings current = settings();

    // 1. Rate limit by transport address
    if (!current.rate_limiter->allow(req.remote_addr)) {
        Logger::warn(Logger::Component::RateLimit,
            fmt::format("Rate limit exceeded for {}", req.remote_addr));
        emit(events::kRateLimitExceeded, req, 429);
        reject(res, 429, "Rate limit exceeded");
        return;
    }

    // 2. Middleware chain
    const int status_before = res.status;
    auto chain_result = current.middlewares->execute(req, res);
    if (!chain_result.has_value()) {
        const Error& err = chain_result.error();
        if (res.status == status_before) {
            reject(res, 403, err.message);
        } else {
            // The middleware wrote its own response
            error_count_.fetch_add(1);
        }
        emit(events::kMiddlewareError, req, res.status, err.message);
        return;
    }
    if (chain_result.value() == MiddlewareResult::Handled) {
        return;
    }

    // 3. Route
    auto route = router_.match(req);
    if (!route) {
        Logger::debug(Logger::Component::Router,
            fmt::format("No route for {} {}", req.method, req.path));
        emit(events::kNoRouteFound, req, 404);
        reject(res, 404, "Not Found");
        return;
    }

    // 4. Server
    auto server = route->backend ? route->backend->get_server() : nullptr;
    if (!server) {
        Logger::error(Logger::Component::Router,
            fmt::format("Route '{}' has no healthy server", route->name));
        emit(events::kNoBackendAvailable, req, 503);
        reject(res, 503, "Service Unavailable");
        return;
    }

    // 5. Cache
    const std::string backend_url = server->url.to_string();
    auto cached = cache_.get(ResponseCache::make_key(req.method, req.path, backend_url));
    if (cached.has_value()) {
        serve_cached(cached.value(), res);
        emit(events::kCacheHit, req, cached->status, {}, backend_url);
        return;
    }

    // 6. Forward
    forward_request(req, res, *server, current);
}

void ProxyEngine::forward_request(const httplib::Request& req, httplib::Response& res,
                                  const Server& server, const Settings& current) {
    const auto start_time = std::chrono::steady_clock::now();
    const std::string backend_url = server.url.to_string();

    httplib::Request outbound;
    outbound.method = req.method;
    outbound.path = httplib::append_query_params(server.url.path + req.path, req.params);
    outbound.body = req.body;
    for (const auto& [key, value] : req.headers) {
        if (!in_list(kRequestHeadersToDrop, key)) {
            outbound.headers.emplace(key, value);
        }
    }

    std::string proto = req.get_header_value("X-Forwarded-Proto");
    outbound.set_header("X-Forwarded-For", client_ip(req));
    outbound.set_header("X-Forwarded-Proto", proto.empty() ? "http" : proto);
    outbound.set_header("X-Real-IP", req.remote_addr);

    emit(events::kRequestForwarded, req, 0, {}, backend_url);

    httplib::Client client(server.url.origin());
    auto sec = static_cast<time_t>(current.upstream_timeout.count() / 1000);
    auto usec = static_cast<time_t>((current.upstream_timeout.count() % 1000) * 1000);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);

    httplib::Response upstream;
    auto send = [&]() -> std::expected<void, Error> {
        auto result = client.send(outbound);
        if (!result) {
            return std::unexpected(Error{ErrorCode::BackendFailure, httplib::to_string(result.error())});
        }
        upstream = std::move(result.value());
        return {};
    };

    std::expected<void, Error> outcome;
    try {
        auto breaker = current.breaker.enabled ? breaker_for(server) : nullptr;
        outcome = breaker ? breaker->call(send) : send();
    } catch (const std::exception& e) {
        outcome = std::unexpected(Error{ErrorCode::BackendFailure, e.what()});
    }

    if (!outcome.has_value()) {
        const Error& err = outcome.error();
        if (err.code == ErrorCode::CircuitOpen) {
            Logger::warn(Logger::Component::Backend,
                fmt::format("Circuit open for {}, failing fast", backend_url));
            emit(events::kCircuitOpen, req, 503, err.message, backend_url);
            reject(res, 503, "Service Unavailable: circuit open");
            return;
        }

        Logger::error(Logger::Component::Backend,
            fmt::format("Backend {} failure: {}", backend_url, err.message));
        emit(events::kProxyError, req, 502, err.message, backend_url);
        reject(res, 502, "Bad Gateway: " + err.message);
        return;
    }

    httplib::Headers headers = filter_response_headers(upstream.headers);

    // Added to whatever the middleware chain already set (CORS and the like)
    res.status = upstream.status;
    for (const auto& [key, value] : headers) {
        res.headers.emplace(key, value);
    }
    res.body = upstream.body;

    if (current.cache.enabled && upstream.status >= 200 && upstream.status < 300 &&
        std::find(current.cache.methods.begin(), current.cache.methods.end(), req.method) !=
            current.cache.methods.end()) {
        cache_.put(ResponseCache::make_key(req.method, req.path, backend_url),
                   upstream.status, std::move(headers), upstream.body, current.cache.ttl);
    }

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    Logger::info(Logger::Component::Response,
        fmt::format("{} {} → {} ({}ms) via {}", req.method, req.path, upstream.status,
            duration_ms, backend_url));
}

void ProxyEngine::serve_cached(const CacheEntry& entry, httplib::Response& res) {
    for (const auto& [key, value] : entry.headers) {
        res.headers.emplace(key, value);
    }
    res.set_header("X-Cache", "HIT");
    res.status = entry.status;
    res.body = entry.body;
}

void ProxyEngine::cache_response(const httplib::Request& req, const Server& server, int status,
                                 httplib::Headers headers, std::string body,
                                 std::chrono::milliseconds ttl) {
    cache_.put(ResponseCache::make_key(req.method, req.path, server.url.to_string()),
               status, std::move(headers), std::move(body), ttl);
}

void ProxyEngine::clear_cache() {
    cache_.clear();
    Logger::info(Logger::Component::Cache, "Response cache cleared");
}

ProxyStats ProxyEngine::get_stats() const {
    return ProxyStats{request_count_.load(), error_count_.load(), cache_.size()};
}

void ProxyEngine::on(const std::string& event_type, EventBus::Handler handler) {
    events_.subscribe(event_type, std::move(handler));
}

std::shared_ptr<CircuitBreaker> ProxyEngine::breaker_for(const Server& server) {
    CircuitBreakerPolicy policy;
    {
        std::shared_lock lock(settings_mutex_);
        policy = settings_.breaker;
    }
    if (!policy.enabled) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(breakers_mutex_);
    auto& breaker = breakers_[server.url.to_string()];
    if (!breaker) {
        breaker = std::make_shared<CircuitBreaker>(
            policy.failure_threshold, policy.success_threshold, policy.timeout);
    }
    return breaker;
}

void ProxyEngine::reject(httplib::Response& res, int status, const std::string& message) {
    error_count_.fetch_add(1);
    res.status = status;
    res.set_content(message, "text/plain");
}

void ProxyEngine::emit(const char* type, const httplib::Request& req, int status,
                       std::string error, std::string backend) {
    Event event;
    event.type = type;
    event.timestamp = std::chrono::system_clock::now();
    event.method = req.method;
    event.path = req.path;
    event.client_ip = client_ip(req);
    event.backend = std::move(backend);
    event.status = status;
    event.error = std::move(error);
    events_.emit(std::move(event));
}

} // namespace rproxy
