#pragma once

#include "errors.hpp"
#include "routing_policy.hpp"
#include "url.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rproxy {

struct Server {
    Url url;
    int32_t weight;              // reserved, selection ignores it
    std::atomic<bool> is_healthy;

    Server(Url u, int32_t w) : url(std::move(u)), weight(w), is_healthy(true) {}

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    nlohmann::json get_metadata(const std::string& key) const;
    void set_metadata(const std::string& key, nlohmann::json value);

private:
    mutable std::shared_mutex metadata_mutex_;
    std::unordered_map<std::string, nlohmann::json> metadata_;
};

// Group of interchangeable servers fronting one logical backend
class Pool {
public:
    explicit Pool(std::string name = {});

    // Parse the url and append a new healthy server (write lock)
    std::expected<std::shared_ptr<Server>, Error> add_server(const std::string& raw_url, int32_t weight = 1);

    // Next healthy server in rotation, nullptr when none is healthy (read lock)
    std::shared_ptr<Server> get_server();

    // nullptr when out of range (read lock)
    std::shared_ptr<Server> get_server_by_index(size_t index) const;

    // Snapshot of every server in insertion order (read lock)
    std::vector<std::shared_ptr<Server>> servers() const;

    // Snapshot of healthy servers in insertion order (read lock)
    std::vector<std::shared_ptr<Server>> healthy_servers() const;

    // Health flags are atomics on the server, no pool lock involved
    static void set_health(Server& server, bool healthy);
    static bool get_health(const Server& server);

    size_t size() const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::vector<std::shared_ptr<Server>> servers_;
    mutable std::shared_mutex mutex_;
    RoundRobinPolicy policy_;
};

} // namespace rproxy
