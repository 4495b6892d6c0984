#include "proxy_runtime.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace rproxy {

void ProxyRuntime::stop() {
    for (auto& checker : health_checkers) {
        checker->stop();
    }
}

namespace {

std::shared_ptr<Pool> build_pool(const BackendConfig& backend) {
    Logger::info(Logger::Component::Config, fmt::format("Setting up backend: {}", backend.id));

    auto pool = std::make_shared<Pool>(backend.id);
    for (const auto& url : backend.servers) {
        auto weight_it = backend.weights.find(url);
        int32_t weight = weight_it == backend.weights.end() ? 1 : weight_it->second;

        auto server = pool->add_server(url, weight);
        if (!server.has_value()) {
            Logger::error(Logger::Component::Config,
                fmt::format("Backend '{}': skipping server: {}", backend.id, server.error().message));
            continue;
        }
        Logger::info(Logger::Component::Config,
            fmt::format("  Added server {}", server.value()->url.to_string()));
    }

    Logger::info(Logger::Component::Config,
        fmt::format("Backend {} has {} servers", backend.id, pool->size()));
    return pool;
}

void subscribe_logging(ProxyEngine& engine) {
    engine.on(events::kRequestForwarded, [](const Event& event) {
        Logger::debug(Logger::Component::Events,
            fmt::format("Request forwarded: {} {} → {}", event.method, event.path, event.backend));
    });
    engine.on(events::kCacheHit, [](const Event& event) {
        Logger::info(Logger::Component::Cache,
            fmt::format("Cache hit: {} {}", event.method, event.path));
    });
    engine.on(events::kProxyError, [](const Event& event) {
        Logger::error(Logger::Component::Events,
            fmt::format("Proxy error for {} {}: {}", event.method, event.path, event.error));
    });
    engine.on(events::kNoBackendAvailable, [](const Event& event) {
        Logger::warn(Logger::Component::Events,
            fmt::format("No backend available for {} {}", event.method, event.path));
    });
    engine.on(events::kCircuitOpen, [](const Event& event) {
        Logger::warn(Logger::Component::Events,
            fmt::format("Circuit open for {}, rejected {} {}", event.backend, event.method, event.path));
    });
}

} // namespace

ProxyRuntime build_runtime(const Config& config, LogSink request_log) {
    ProxyRuntime runtime;
    runtime.engine = std::make_shared<ProxyEngine>();
    ProxyEngine& engine = *runtime.engine;

    for (const auto& backend : config.backends) {
        auto pool = build_pool(backend);

        if (backend.health_check.enabled) {
            auto checker = std::make_unique<HealthChecker>(pool, backend.health_check);
            checker->start();
            runtime.health_checkers.push_back(std::move(checker));
        }

        runtime.pools[backend.id] = std::move(pool);
    }

    for (const auto& rc : config.routes) {
        auto pool_it = runtime.pools.find(rc.backend_id);
        if (pool_it == runtime.pools.end()) {
            Logger::error(Logger::Component::Config,
                fmt::format("Backend {} not found for route {}", rc.backend_id, rc.name));
            continue;
        }

        Route route;
        route.name = rc.name;
        route.pattern = rc.pattern;
        route.path_prefix = rc.path_prefix;
        route.subdomain = rc.subdomain;
        route.headers = rc.headers;
        route.methods = rc.methods;
        route.backend = pool_it->second;
        route.priority = rc.priority;

        auto added = engine.add_route(std::move(route));
        if (!added.has_value()) {
            Logger::error(Logger::Component::Config,
                fmt::format("Failed to add route: {}", added.error().message));
        }
    }

    const auto& policies = config.policies;

    if (policies.cors.enabled) {
        engine.add_middleware(CorsMiddleware(policies.cors.allowed_origins));
    }

    if (policies.auth.enabled) {
        engine.add_middleware(AuthMiddleware(AuthMiddleware::bearer_validator(policies.auth.secret)));
    }

    if (!request_log) {
        request_log = Logger::request_sink();
    }
    engine.add_middleware(LoggingMiddleware(std::move(request_log)));

    if (policies.rate_limit.enabled) {
        engine.set_rate_limit(policies.rate_limit.max_requests, policies.rate_limit.window);
    }

    engine.set_cache_policy(policies.cache);
    engine.set_circuit_breaker_policy(policies.circuit_breaker);
    engine.set_upstream_timeout(config.server.upstream_timeout);

    subscribe_logging(engine);

    Logger::info(Logger::Component::Config,
        fmt::format("Runtime ready: {} backends, {} routes, {} health checkers",
            runtime.pools.size(), engine.router().size(), runtime.health_checkers.size()));

    return runtime;
}

} // namespace rproxy
