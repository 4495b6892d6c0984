#pragma once

#include "errors.hpp"
#include <httplib.h>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace rproxy {

enum class MiddlewareResult {
    Continue,   // hand the request to the next stage
    Handled     // the middleware wrote the complete response
};

using Middleware = std::function<std::expected<MiddlewareResult, Error>(
    const httplib::Request&, httplib::Response&)>;

using LogSink = std::function<void(const std::string&)>;

// Runs middlewares in registration order, stopping at the first error or
// at the first middleware that handled the request itself.
class MiddlewareChain {
public:
    MiddlewareChain& add(Middleware middleware);

    std::expected<MiddlewareResult, Error> execute(const httplib::Request& req, httplib::Response& res) const;

    size_t size() const { return middlewares_.size(); }

private:
    std::vector<Middleware> middlewares_;
};

class CorsMiddleware {
public:
    explicit CorsMiddleware(std::vector<std::string> allowed_origins);

    std::expected<MiddlewareResult, Error> operator()(const httplib::Request& req, httplib::Response& res) const;

private:
    bool origin_allowed(const std::string& origin) const;

    std::vector<std::string> allowed_origins_;
};

// Missing Authorization header: 401. Token rejected by the validator: 403.
class AuthMiddleware {
public:
    using Validator = std::function<bool(const std::string&)>;

    explicit AuthMiddleware(Validator validator);

    std::expected<MiddlewareResult, Error> operator()(const httplib::Request& req, httplib::Response& res) const;

    // Any non-empty token when secret is empty, else exactly "Bearer <secret>"
    static Validator bearer_validator(const std::string& secret);

private:
    Validator validator_;
};

class LoggingMiddleware {
public:
    explicit LoggingMiddleware(LogSink sink);

    std::expected<MiddlewareResult, Error> operator()(const httplib::Request& req, httplib::Response& res) const;

private:
    LogSink sink_;
};

} // namespace rproxy
