#include "middleware.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace rproxy {

MiddlewareChain& MiddlewareChain::add(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
    return *this;
}

std::expected<MiddlewareResult, Error> MiddlewareChain::execute(const httplib::Request& req,
                                                               httplib::Response& res) const {
    for (const auto& middleware : middlewares_) {
        auto result = middleware(req, res);
        if (!result.has_value() || result.value() == MiddlewareResult::Handled) {
            return result;
        }
    }
    return MiddlewareResult::Continue;
}

CorsMiddleware::CorsMiddleware(std::vector<std::string> allowed_origins)
    : allowed_origins_(std::move(allowed_origins)) {}

bool CorsMiddleware::origin_allowed(const std::string& origin) const {
    return std::any_of(allowed_origins_.begin(), allowed_origins_.end(),
        [&origin](const std::string& allowed) { return allowed == "*" || allowed == origin; });
}

std::expected<MiddlewareResult, Error> CorsMiddleware::operator()(const httplib::Request& req,
                                                                 httplib::Response& res) const {
    std::string origin = req.get_header_value("Origin");

    if (origin_allowed(origin)) {
        res.set_header("Access-Control-Allow-Origin", origin);
        res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
    }

    // Preflight is answered here
    if (req.method == "OPTIONS") {
        res.status = 200;
        return MiddlewareResult::Handled;
    }

    return MiddlewareResult::Continue;
}

AuthMiddleware::AuthMiddleware(Validator validator) : validator_(std::move(validator)) {}

std::expected<MiddlewareResult, Error> AuthMiddleware::operator()(const httplib::Request& req,
                                                                 httplib::Response& res) const {
    std::string token = req.get_header_value("Authorization");
    if (token.empty()) {
        res.status = 401;
        res.set_content("Unauthorized", "text/plain");
        return std::unexpected(Error{ErrorCode::Unauthorized, "unauthorized"});
    }

    if (!validator_(token)) {
        res.status = 403;
        res.set_content("Forbidden", "text/plain");
        return std::unexpected(Error{ErrorCode::Forbidden, "forbidden"});
    }

    return MiddlewareResult::Continue;
}

AuthMiddleware::Validator AuthMiddleware::bearer_validator(const std::string& secret) {
    if (secret.empty()) {
        return [](const std::string& token) { return !token.empty(); };
    }
    return [wanted = "Bearer " + secret](const std::string& token) { return token == wanted; };
}

LoggingMiddleware::LoggingMiddleware(LogSink sink) : sink_(std::move(sink)) {}

std::expected<MiddlewareResult, Error> LoggingMiddleware::operator()(const httplib::Request& req,
                                                                    httplib::Response&) const {
    if (sink_) {
        sink_(fmt::format("{} {} from {}", req.method, req.path, req.remote_addr));
    }
    return MiddlewareResult::Continue;
}

} // namespace rproxy
