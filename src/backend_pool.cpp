#include "backend_pool.hpp"
#include <mutex>

namespace rproxy {

nlohmann::json Server::get_metadata(const std::string& key) const {
    std::shared_lock lock(metadata_mutex_);
    auto it = metadata_.find(key);
    if (it == metadata_.end()) {
        return nullptr;
    }
    return it->second;
}

void Server::set_metadata(const std::string& key, nlohmann::json value) {
    std::unique_lock lock(metadata_mutex_);
    metadata_[key] = std::move(value);
}

Pool::Pool(std::string name) : name_(std::move(name)) {}

std::expected<std::shared_ptr<Server>, Error> Pool::add_server(const std::string& raw_url, int32_t weight) {
    auto url = Url::parse(raw_url);
    if (!url.has_value()) {
        return std::unexpected(url.error());
    }

    auto server = std::make_shared<Server>(std::move(url.value()), weight);

    std::unique_lock lock(mutex_);
    servers_.push_back(server);
    return server;
}

std::shared_ptr<Server> Pool::get_server() {
    auto healthy = healthy_servers();
    if (healthy.empty()) {
        return nullptr;
    }
    return policy_.select(healthy);
}

std::shared_ptr<Server> Pool::get_server_by_index(size_t index) const {
    std::shared_lock lock(mutex_);
    if (index >= servers_.size()) {
        return nullptr;
    }
    return servers_[index];
}

std::vector<std::shared_ptr<Server>> Pool::servers() const {
    std::shared_lock lock(mutex_);
    return servers_;
}

std::vector<std::shared_ptr<Server>> Pool::healthy_servers() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<Server>> result;
    result.reserve(servers_.size());
    for (const auto& server : servers_) {
        if (server->is_healthy.load()) {
            result.push_back(server);
        }
    }
    return result;
}

void Pool::set_health(Server& server, bool healthy) {
    server.is_healthy.store(healthy);
}

bool Pool::get_health(const Server& server) {
    return server.is_healthy.load();
}

size_t Pool::size() const {
    std::shared_lock lock(mutex_);
    return servers_.size();
}

} // namespace rproxy
