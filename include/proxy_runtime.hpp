#pragma once

#include "backend_pool.hpp"
#include "config_loader.hpp"
#include "health_checker.hpp"
#include "middleware.hpp"
#include "proxy_engine.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace rproxy {

// Everything a running proxy owns, wired from one Config
struct ProxyRuntime {
    std::shared_ptr<ProxyEngine> engine;
    std::unordered_map<std::string, std::shared_ptr<Pool>> pools;
    std::vector<std::unique_ptr<HealthChecker>> health_checkers;

    void stop();
};

// Bad server urls, bad route patterns and routes naming an unknown backend
// are logged and skipped. Health checkers are started before returning.
// request_log receives one line per request; empty logs through Logger.
ProxyRuntime build_runtime(const Config& config, LogSink request_log = {});

} // namespace rproxy
