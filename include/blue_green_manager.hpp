#pragma once

#include "backend_pool.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>

namespace rproxy {

enum class DeploymentColor {
    Blue,
    Green
};

std::string_view to_string(DeploymentColor color);

// Two live versions of one backend with a timed traffic shift between them.
// While a shift runs, requests whose identifier bucket falls below the shift
// percentage go to the target version, the rest stay on the active one.
class BlueGreenManager {
public:
    using Clock = std::chrono::steady_clock;

    BlueGreenManager(std::shared_ptr<Pool> blue, std::shared_ptr<Pool> green);
    ~BlueGreenManager();

    BlueGreenManager(const BlueGreenManager&) = delete;
    BlueGreenManager& operator=(const BlueGreenManager&) = delete;

    std::shared_ptr<Pool> select_backend(const httplib::Request& req) const;
    std::shared_ptr<Pool> select_for(const std::string& identifier) const;

    // Recomputes the shift every tick as elapsed/duration*100 on its own
    // thread; at the end the shift pins at 100 and target becomes active.
    // A shift already in progress is abandoned where it stands.
    void start_gradual_shift(DeploymentColor target, std::chrono::milliseconds duration,
                             std::chrono::milliseconds tick = std::chrono::milliseconds(100));

    void stop_shift();

    DeploymentColor active_version() const { return active_.load(); }
    DeploymentColor target_version() const { return target_.load(); }
    double traffic_shift() const { return traffic_shift_.load(); }
    bool shifting() const { return shifting_.load(); }

    nlohmann::json status() const;

private:
    void shift_loop(std::stop_token stop_token, std::chrono::milliseconds tick);
    void complete_shift();
    std::shared_ptr<Pool> pool_for(DeploymentColor color) const;

    std::shared_ptr<Pool> blue_;
    std::shared_ptr<Pool> green_;

    std::atomic<DeploymentColor> active_{DeploymentColor::Blue};
    std::atomic<DeploymentColor> target_{DeploymentColor::Blue};
    std::atomic<double> traffic_shift_{0.0};
    std::atomic<bool> shifting_{false};

    mutable std::mutex shift_mutex_;
    Clock::time_point start_time_;
    std::chrono::milliseconds shift_duration_{0};

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread shift_thread_;
};

} // namespace rproxy
