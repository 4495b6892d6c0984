#include "health_checker.hpp"
#include "logger.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>

namespace rproxy {

HealthChecker::HealthChecker(std::shared_ptr<Pool> pool, const HealthCheckConfig& config)
    : pool_(std::move(pool)), config_(config) {
    if (config_.path.empty()) {
        config_.path = "/health";
    }
}

HealthChecker::~HealthChecker() {
    stop();
}

void HealthChecker::start() {
    if (health_check_thread_.joinable()) {
        return;
    }
    health_check_thread_ = std::jthread([this](std::stop_token stop_token) {
        health_check_loop(stop_token);
    });
}

void HealthChecker::stop() {
    if (health_check_thread_.joinable()) {
        health_check_thread_.request_stop();
        health_check_thread_.join();
    }
}

void HealthChecker::health_check_loop(std::stop_token stop_token) {
    Logger::info(Logger::Component::HealthCheck,
        fmt::format("Health check thread started for pool '{}'", pool_->name()));

    while (!stop_token.stop_requested()) {
        // Wait one interval; a stop request wakes us early
        {
            std::unique_lock lock(wait_mutex_);
            if (wait_cv_.wait_for(lock, stop_token, config_.interval,
                                  [&stop_token] { return stop_token.stop_requested(); })) {
                break;
            }
        }

        check_health();
    }

    Logger::info(Logger::Component::HealthCheck,
        fmt::format("Health check thread stopped for pool '{}'", pool_->name()));
}

void HealthChecker::check_health() {
    Logger::debug(Logger::Component::HealthCheck,
        fmt::format("Starting health check cycle for pool '{}'", pool_->name()));

    for (auto& server : pool_->servers()) {
        {
            std::lock_guard<std::mutex> lock(in_flight_->mutex);
            if (!in_flight_->servers.insert(server.get()).second) {
                Logger::debug(Logger::Component::HealthCheck,
                    fmt::format("Server {}: previous probe still running, skipping",
                        server->url.to_string()));
                continue;
            }
        }

        // Each probe owns what it touches, nothing refers back to this checker
        std::thread([server, in_flight = in_flight_, path = config_.path, timeout = config_.timeout]() {
            bool was_healthy = Pool::get_health(*server);

            auto start = std::chrono::steady_clock::now();
            bool is_healthy = probe(*server, path, timeout);
            auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();

            Pool::set_health(*server, is_healthy);

            const std::string target = server->url.to_string();
            if (is_healthy) {
                Logger::debug(Logger::Component::HealthCheck,
                    fmt::format("Server {}: HEALTHY ({}ms)", target, duration_ms));
            } else {
                Logger::error(Logger::Component::HealthCheck,
                    fmt::format("Server {}: UNHEALTHY ({}ms)", target, duration_ms));
            }

            if (was_healthy && !is_healthy) {
                Logger::warn(Logger::Component::HealthCheck,
                    fmt::format("Server {}: state changed HEALTHY → UNHEALTHY", target));
            } else if (!was_healthy && is_healthy) {
                Logger::info(Logger::Component::HealthCheck,
                    fmt::format("Server {}: state changed UNHEALTHY → HEALTHY", target));
            }

            std::lock_guard<std::mutex> lock(in_flight->mutex);
            in_flight->servers.erase(server.get());
        }).detach();
    }
}

size_t HealthChecker::probes_in_flight() const {
    std::lock_guard<std::mutex> lock(in_flight_->mutex);
    return in_flight_->servers.size();
}

bool HealthChecker::probe(const Server& server, const std::string& path, std::chrono::milliseconds timeout) {
    try {
        httplib::Client client(server.url.origin());
        auto sec = static_cast<time_t>(timeout.count() / 1000);
        auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
        client.set_connection_timeout(sec, usec);
        client.set_read_timeout(sec, usec);
        client.set_write_timeout(sec, usec);

        auto res = client.Get(path);

        return res && res->status == 200;

    } catch (const std::exception& e) {
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("Server {} health check exception: {}", server.url.to_string(), e.what()));
        return false;
    }
}

} // namespace rproxy
