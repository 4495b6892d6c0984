#pragma once

#include <vector>
#include <atomic>
#include <memory>
#include <concepts>
#include <cstddef>

namespace rproxy {

struct Server;

// A selection policy picks one server out of a non-empty healthy snapshot
template<typename T>
concept SelectionPolicy = requires(T policy, const std::vector<std::shared_ptr<Server>>& servers) {
    { policy.select(servers) } -> std::same_as<std::shared_ptr<Server>>;
};

// Round-robin over whatever snapshot it is handed. The counter is shared by
// every caller of the owning pool, so the counter-to-server mapping shifts
// whenever the size of the healthy snapshot changes.
class RoundRobinPolicy {
public:
    RoundRobinPolicy() : counter_(0) {}

    std::shared_ptr<Server> select(const std::vector<std::shared_ptr<Server>>& servers) {
        if (servers.empty()) {
            return nullptr;
        }

        // Advance first, then index with the new value
        size_t value = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
        return servers[value % servers.size()];
    }

    void reset() {
        counter_.store(0, std::memory_order_relaxed);
    }

    size_t counter() const {
        return counter_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<size_t> counter_;
};

static_assert(SelectionPolicy<RoundRobinPolicy>);

} // namespace rproxy
