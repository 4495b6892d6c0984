#include "config_loader.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace rproxy {

namespace {

// Reads an optional duration field; absent keeps the default
std::expected<std::chrono::milliseconds, std::string> read_duration(
    const json& section, const std::string& key, std::chrono::milliseconds fallback) {
    if (!section.contains(key) || section[key].is_null()) {
        return fallback;
    }
    const auto& value = section[key];
    if (value.is_number_integer()) {
        return std::chrono::milliseconds(value.get<int64_t>());
    }
    if (!value.is_string()) {
        return std::unexpected(fmt::format("'{}' must be a duration string", key));
    }
    auto parsed = ConfigLoader::parse_duration(value.get<std::string>());
    if (!parsed.has_value()) {
        return std::unexpected(fmt::format("'{}': {}", key, parsed.error()));
    }
    return parsed.value();
}

std::expected<uint16_t, std::string> read_port(const json& section, uint16_t fallback) {
    if (!section.contains("port")) {
        return fallback;
    }
    const auto& value = section["port"];

    int64_t port = 0;
    if (value.is_string()) {
        // Accept "9000" as well as ":9000"
        std::string text = value.get<std::string>();
        if (!text.empty() && text.front() == ':') {
            text.erase(0, 1);
        }
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            return std::unexpected(fmt::format("invalid port '{}'", value.get<std::string>()));
        }
    } else if (value.is_number_integer()) {
        port = value.get<int64_t>();
    } else {
        return std::unexpected(std::string("'port' must be a number or a string"));
    }

    if (port < 1 || port > 65535) {
        return std::unexpected(fmt::format("port {} out of range 1-65535", port));
    }
    return static_cast<uint16_t>(port);
}

} // namespace

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,
        "../" + config_path,
        "../../" + config_path
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear();
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_config(buffer.str());
}

std::expected<std::chrono::milliseconds, std::string> ConfigLoader::parse_duration(const std::string& text) {
    size_t unit_pos = 0;
    while (unit_pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[unit_pos])) != 0)) {
        ++unit_pos;
    }
    if (unit_pos == 0) {
        return std::unexpected("invalid duration '" + text + "'");
    }

    int64_t amount = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + unit_pos, amount);
    if (ec != std::errc()) {
        return std::unexpected("invalid duration '" + text + "'");
    }

    std::string unit = text.substr(unit_pos);
    if (unit == "ms") return std::chrono::milliseconds(amount);
    if (unit == "s") return std::chrono::seconds(amount);
    if (unit == "m") return std::chrono::minutes(amount);
    if (unit == "h") return std::chrono::hours(amount);

    return std::unexpected("invalid duration unit in '" + text + "'");
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        Config config;

        // server section
        if (!j.contains("server")) {
            return std::unexpected("Missing 'server' section");
        }
        const auto& srv = j["server"];
        config.server.host = srv.value("host", config.server.host);
        auto port = read_port(srv, config.server.port);
        if (!port) {
            return std::unexpected(port.error());
        }
        config.server.port = port.value();
        config.server.tls = srv.value("tls", false);
        config.server.cert_file = srv.value("cert_file", "");
        config.server.key_file = srv.value("key_file", "");
        config.server.log_file = srv.value("log_file", config.server.log_file);
        config.server.log_level = srv.value("log_level", config.server.log_level);
        auto upstream_timeout = read_duration(srv, "upstream_timeout", config.server.upstream_timeout);
        if (!upstream_timeout) {
            return std::unexpected(upstream_timeout.error());
        }
        config.server.upstream_timeout = upstream_timeout.value();

        // backends section
        if (!j.contains("backends")) {
            return std::unexpected("Missing 'backends' section");
        }
        for (const auto& backend : j["backends"]) {
            BackendConfig bc;
            bc.id = backend.value("id", "");
            bc.servers = backend.value("servers", std::vector<std::string>{});
            bc.weights = backend.value("weights", std::map<std::string, int32_t>{});

            if (backend.contains("health_check")) {
                const auto& hc = backend["health_check"];
                bc.health_check.enabled = hc.value("enabled", false);
                bc.health_check.path = hc.value("path", bc.health_check.path);
                if (bc.health_check.path.empty()) {
                    bc.health_check.path = "/health";
                }

                auto interval = read_duration(hc, "interval", bc.health_check.interval);
                if (!interval) {
                    return std::unexpected(fmt::format("backend '{}': {}", bc.id, interval.error()));
                }
                bc.health_check.interval = interval.value();

                auto timeout = read_duration(hc, "timeout", bc.health_check.timeout);
                if (!timeout) {
                    return std::unexpected(fmt::format("backend '{}': {}", bc.id, timeout.error()));
                }
                bc.health_check.timeout = timeout.value();
            }

            config.backends.push_back(std::move(bc));
        }

        // routes section (optional)
        if (j.contains("routes")) {
            for (const auto& route : j["routes"]) {
                RouteConfig rc;
                rc.name = route.value("name", "");
                rc.path_prefix = route.value("path_prefix", "");
                rc.pattern = route.value("pattern", "");
                rc.subdomain = route.value("subdomain", "");
                rc.headers = route.value("headers", std::map<std::string, std::string>{});
                rc.methods = route.value("methods", std::vector<std::string>{});
                rc.backend_id = route.value("backend_id", "");
                rc.priority = route.value("priority", 0);
                config.routes.push_back(std::move(rc));
            }
        }

        // policies section (optional)
        if (j.contains("policies")) {
            const auto& policies = j["policies"];

            if (policies.contains("rate_limit")) {
                const auto& rl = policies["rate_limit"];
                auto& policy = config.policies.rate_limit;
                policy.enabled = rl.value("enabled", false);
                policy.max_requests = rl.value("max_requests", policy.max_requests);
                auto window = read_duration(rl, "window", policy.window);
                if (!window) {
                    return std::unexpected("rate_limit: " + window.error());
                }
                policy.window = window.value();
            }

            if (policies.contains("cors")) {
                const auto& cors = policies["cors"];
                config.policies.cors.enabled = cors.value("enabled", false);
                config.policies.cors.allowed_origins =
                    cors.value("allowed_origins", std::vector<std::string>{});
            }

            if (policies.contains("auth")) {
                const auto& auth = policies["auth"];
                config.policies.auth.enabled = auth.value("enabled", false);
                config.policies.auth.type = auth.value("type", config.policies.auth.type);
                config.policies.auth.secret = auth.value("secret", "");
            }

            if (policies.contains("cache")) {
                const auto& cache = policies["cache"];
                auto& policy = config.policies.cache;
                policy.enabled = cache.value("enabled", false);
                policy.methods = cache.value("methods", policy.methods);
                auto ttl = read_duration(cache, "ttl", policy.ttl);
                if (!ttl) {
                    return std::unexpected("cache: " + ttl.error());
                }
                policy.ttl = ttl.value();
            }

            if (policies.contains("circuit_breaker")) {
                const auto& cb = policies["circuit_breaker"];
                auto& policy = config.policies.circuit_breaker;
                policy.enabled = cb.value("enabled", false);
                policy.failure_threshold = cb.value("failure_threshold", policy.failure_threshold);
                policy.success_threshold = cb.value("success_threshold", policy.success_threshold);
                auto timeout = read_duration(cb, "timeout", policy.timeout);
                if (!timeout) {
                    return std::unexpected("circuit_breaker: " + timeout.error());
                }
                policy.timeout = timeout.value();
            }
        }

        auto valid = validate_config(config);
        if (!valid) {
            return std::unexpected("Configuration validation failed: " + valid.error());
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    } catch (const std::logic_error& e) {
        return std::unexpected(std::string("Invalid value: ") + e.what());
    }
}

std::expected<void, std::string> ConfigLoader::validate_config(const Config& config) {
    if (config.server.port == 0) {
        return std::unexpected("server port must be non-zero");
    }

    if (config.backends.empty()) {
        return std::unexpected("no backends configured");
    }

    for (const auto& backend : config.backends) {
        if (backend.id.empty()) {
            return std::unexpected("backend without id");
        }
        if (backend.health_check.enabled &&
            (backend.health_check.interval.count() <= 0 || backend.health_check.timeout.count() <= 0)) {
            return std::unexpected("backend '" + backend.id + "' has a non-positive health check interval or timeout");
        }
    }

    const auto& rate_limit = config.policies.rate_limit;
    if (rate_limit.enabled && (rate_limit.max_requests <= 0 || rate_limit.window.count() <= 0)) {
        return std::unexpected("rate_limit needs positive max_requests and window");
    }

    const auto& breaker = config.policies.circuit_breaker;
    if (breaker.enabled && (breaker.failure_threshold <= 0 || breaker.success_threshold <= 0)) {
        return std::unexpected("circuit_breaker thresholds must be positive");
    }

    return {};
}

} // namespace rproxy
