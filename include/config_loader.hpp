#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <vector>

namespace rproxy {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 9000;
    bool tls = false;
    std::string cert_file;
    std::string key_file;
    std::string log_file = "logs/proxy.log";
    std::string log_level = "INFO";
    std::chrono::milliseconds upstream_timeout{30000};
};

struct HealthCheckConfig {
    bool enabled = false;
    std::chrono::milliseconds interval{30000};
    std::chrono::milliseconds timeout{5000};
    std::string path = "/health";
};

struct BackendConfig {
    std::string id;
    std::vector<std::string> servers;
    std::map<std::string, int32_t> weights;
    HealthCheckConfig health_check;
};

struct RouteConfig {
    std::string name;
    std::string path_prefix;
    std::string pattern;
    std::string subdomain;
    std::map<std::string, std::string> headers;
    std::vector<std::string> methods;
    std::string backend_id;
    int priority = 0;
};

struct RateLimitPolicy {
    bool enabled = false;
    int max_requests = 1000;
    std::chrono::milliseconds window{60000};
};

struct CorsPolicy {
    bool enabled = false;
    std::vector<std::string> allowed_origins;
};

struct AuthPolicy {
    bool enabled = false;
    std::string type = "bearer";
    std::string secret;
};

struct CachePolicyConfig {
    bool enabled = false;
    std::chrono::milliseconds ttl{60000};
    std::vector<std::string> methods{"GET"};
};

struct CircuitBreakerPolicy {
    bool enabled = false;
    int64_t failure_threshold = 5;
    int64_t success_threshold = 2;
    std::chrono::milliseconds timeout{30000};
};

struct PoliciesConfig {
    RateLimitPolicy rate_limit;
    CorsPolicy cors;
    AuthPolicy auth;
    CachePolicyConfig cache;
    CircuitBreakerPolicy circuit_breaker;
};

struct Config {
    ServerConfig server;
    std::vector<BackendConfig> backends;
    std::vector<RouteConfig> routes;
    PoliciesConfig policies;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

    // "250ms", "30s", "5m", "1h"
    static std::expected<std::chrono::milliseconds, std::string> parse_duration(const std::string& text);

private:
    static std::expected<Config, std::string> parse_config(const std::string& content);
    static std::expected<void, std::string> validate_config(const Config& config);
};

} // namespace rproxy
