#include "blue_green_manager.hpp"
#include "logger.hpp"
#include "request_utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace rproxy {

std::string_view to_string(DeploymentColor color) {
    return color == DeploymentColor::Blue ? "blue" : "green";
}

BlueGreenManager::BlueGreenManager(std::shared_ptr<Pool> blue, std::shared_ptr<Pool> green)
    : blue_(std::move(blue)), green_(std::move(green)) {}

BlueGreenManager::~BlueGreenManager() {
    stop_shift();
}

std::shared_ptr<Pool> BlueGreenManager::select_backend(const httplib::Request& req) const {
    return select_for(routing_identifier(req));
}

std::shared_ptr<Pool> BlueGreenManager::select_for(const std::string& identifier) const {
    // traffic_shift_ is written before target_ when a shift starts
    DeploymentColor target = target_.load();
    double shift = traffic_shift_.load();
    if (bucket_of(identifier) < static_cast<int64_t>(shift)) {
        return pool_for(target);
    }
    return pool_for(active_.load());
}

void BlueGreenManager::start_gradual_shift(DeploymentColor target, std::chrono::milliseconds duration,
                                           std::chrono::milliseconds tick) {
    std::lock_guard<std::mutex> lock(shift_mutex_);

    if (shift_thread_.joinable()) {
        shift_thread_.request_stop();
        shift_thread_.join();
    }

    start_time_ = Clock::now();
    shift_duration_ = duration;
    traffic_shift_.store(0.0);
    target_.store(target);
    shifting_.store(true);

    Logger::info(Logger::Component::Traffic,
        fmt::format("Shifting traffic {} → {} over {}ms",
            to_string(active_.load()), to_string(target), duration.count()));

    if (duration.count() <= 0) {
        complete_shift();
        return;
    }

    shift_thread_ = std::jthread([this, tick](std::stop_token stop_token) {
        shift_loop(stop_token, tick);
    });
}

void BlueGreenManager::stop_shift() {
    std::lock_guard<std::mutex> lock(shift_mutex_);
    if (shift_thread_.joinable()) {
        shift_thread_.request_stop();
        shift_thread_.join();
    }
    shifting_.store(false);
}

void BlueGreenManager::shift_loop(std::stop_token stop_token, std::chrono::milliseconds tick) {
    // start_time_ and shift_duration_ are fixed while this thread runs
    const Clock::time_point start = start_time_;
    const std::chrono::milliseconds duration = shift_duration_;

    while (!stop_token.stop_requested()) {
        {
            std::unique_lock lock(wait_mutex_);
            if (wait_cv_.wait_for(lock, stop_token, tick,
                                  [&stop_token] { return stop_token.stop_requested(); })) {
                return;
            }
        }

        auto elapsed = Clock::now() - start;
        if (elapsed >= duration) {
            complete_shift();
            return;
        }

        double progress = std::chrono::duration<double>(elapsed).count() /
                          std::chrono::duration<double>(duration).count();
        traffic_shift_.store(progress * 100.0);
    }
}

void BlueGreenManager::complete_shift() {
    traffic_shift_.store(100.0);
    active_.store(target_.load());
    shifting_.store(false);

    Logger::info(Logger::Component::Traffic,
        fmt::format("Traffic shift complete, {} is active", to_string(active_.load())));
}

std::shared_ptr<Pool> BlueGreenManager::pool_for(DeploymentColor color) const {
    return color == DeploymentColor::Blue ? blue_ : green_;
}

nlohmann::json BlueGreenManager::status() const {
    std::lock_guard<std::mutex> lock(shift_mutex_);

    long long elapsed_ms = 0;
    if (start_time_ != Clock::time_point{}) {
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - start_time_).count();
    }

    return nlohmann::json{
        {"active_version", std::string(to_string(active_.load()))},
        {"target_version", std::string(to_string(target_.load()))},
        {"traffic_shift", traffic_shift_.load()},
        {"shift_duration_ms", shift_duration_.count()},
        {"elapsed_ms", elapsed_ms},
        {"shifting", shifting_.load()}
    };
}

} // namespace rproxy
