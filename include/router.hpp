#pragma once

#include "backend_pool.hpp"
#include "errors.hpp"
#include <httplib.h>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rproxy {

// A routing rule. Every configured predicate must hold; an empty one is ignored.
struct Route {
    std::string name;
    std::string pattern;                          // regex searched in the path
    std::string path_prefix;
    std::string subdomain;
    std::map<std::string, std::string> headers;   // exact value match
    std::vector<std::string> methods;
    std::shared_ptr<Pool> backend;
    int priority = 0;

    bool matches(const httplib::Request& req) const;

private:
    friend class Router;
    std::optional<std::regex> regex_;
};

// Priority-ordered route table; higher priority first, ties in insertion order
class Router {
public:
    // Compiles the pattern once; fails with InvalidPattern (write lock)
    std::expected<void, Error> add_route(Route route);

    // First route whose predicates all hold, nullptr otherwise (read lock)
    std::shared_ptr<const Route> match(const httplib::Request& req) const;

    // Removes the first route with this name (write lock)
    bool remove_route(const std::string& name);

    // Snapshot in match order (read lock)
    std::vector<std::shared_ptr<const Route>> list_routes() const;

    size_t size() const;

private:
    std::vector<std::shared_ptr<const Route>> routes_;
    mutable std::shared_mutex mutex_;
};

// Exact Content-Type lookup, independent of priority matching
class ContentRouter {
public:
    using ContentTypeRoutes = std::unordered_map<std::string, std::shared_ptr<Pool>>;

    std::shared_ptr<Pool> route_by_content_type(const httplib::Request& req,
                                                const ContentTypeRoutes& routes) const;

    Router& router() { return router_; }

private:
    Router router_;
};

} // namespace rproxy
