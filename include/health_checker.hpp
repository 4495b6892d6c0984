#pragma once

#include "backend_pool.hpp"
#include "config_loader.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_set>

namespace rproxy {

// Periodically probes every server of one pool. Each tick fires one
// independent probe per server; probes are not joined, so stop() only
// prevents future ticks. A server whose previous probe is still running is
// skipped for that tick, so at most one probe per server is ever in flight.
class HealthChecker {
public:
    HealthChecker(std::shared_ptr<Pool> pool, const HealthCheckConfig& config);

    ~HealthChecker();

    // Start health checking in background thread
    void start();

    // Stop future ticks; in-flight probes finish on their own
    void stop();

    bool running() const { return health_check_thread_.joinable(); }

    // Probes started and not yet finished
    size_t probes_in_flight() const;

    // One synchronous probe: GET origin + path, healthy only on 200
    static bool probe(const Server& server, const std::string& path, std::chrono::milliseconds timeout);

private:
    void health_check_loop(std::stop_token stop_token);
    void check_health();

    // Shared with the detached probe threads, which may outlive the checker
    struct InFlight {
        std::mutex mutex;
        std::unordered_set<const Server*> servers;
    };

    std::shared_ptr<Pool> pool_;
    HealthCheckConfig config_;
    std::shared_ptr<InFlight> in_flight_ = std::make_shared<InFlight>();
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread health_check_thread_;
};

} // namespace rproxy
