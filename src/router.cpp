#include "router.hpp"
#include "logger.hpp"
#include "request_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <mutex>

namespace rproxy {

bool Route::matches(const httplib::Request& req) const {
    if (!methods.empty() &&
        std::find(methods.begin(), methods.end(), req.method) == methods.end()) {
        return false;
    }

    if (!subdomain.empty() && subdomain_of(req) != subdomain) {
        return false;
    }

    for (const auto& [key, value] : headers) {
        if (req.get_header_value(key) != value) {
            return false;
        }
    }

    if (!path_prefix.empty() && !req.path.starts_with(path_prefix)) {
        return false;
    }

    if (regex_.has_value() && !std::regex_search(req.path, *regex_)) {
        return false;
    }

    return true;
}

std::expected<void, Error> Router::add_route(Route route) {
    if (!route.pattern.empty()) {
        try {
            route.regex_.emplace(route.pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return std::unexpected(Error{ErrorCode::InvalidPattern,
                fmt::format("route '{}': bad pattern '{}': {}", route.name, route.pattern, e.what())});
        }
    }

    auto entry = std::make_shared<const Route>(std::move(route));

    std::unique_lock lock(mutex_);
    routes_.push_back(entry);
    std::stable_sort(routes_.begin(), routes_.end(),
        [](const auto& a, const auto& b) { return a->priority > b->priority; });

    Logger::debug(Logger::Component::Router,
        fmt::format("Added route '{}' (priority {}), {} routes total",
            entry->name, entry->priority, routes_.size()));
    return {};
}

std::shared_ptr<const Route> Router::match(const httplib::Request& req) const {
    std::shared_lock lock(mutex_);
    for (const auto& route : routes_) {
        if (route->matches(req)) {
            return route;
        }
    }
    return nullptr;
}

bool Router::remove_route(const std::string& name) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(routes_.begin(), routes_.end(),
        [&name](const auto& route) { return route->name == name; });
    if (it == routes_.end()) {
        return false;
    }
    routes_.erase(it);
    return true;
}

std::vector<std::shared_ptr<const Route>> Router::list_routes() const {
    std::shared_lock lock(mutex_);
    return routes_;
}

size_t Router::size() const {
    std::shared_lock lock(mutex_);
    return routes_.size();
}

std::shared_ptr<Pool> ContentRouter::route_by_content_type(const httplib::Request& req,
                                                           const ContentTypeRoutes& routes) const {
    auto it = routes.find(req.get_header_value("Content-Type"));
    if (it == routes.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace rproxy
