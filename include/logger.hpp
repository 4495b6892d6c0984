#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace rproxy {

// Process-wide logging facade. Every call is a no-op until init() ran, so
// library code and tests can log without configuring anything.
class Logger {
public:
    enum class Component {
        Proxy,
        Config,
        HealthCheck,
        Request,
        Router,
        Response,
        Backend,
        Cache,
        RateLimit,
        Events,
        Traffic
    };

    // Console at INFO or above plus a rotating file at log_level
    static void init(const std::string& log_file, const std::string& log_level);

    static void shutdown();

    static bool initialized() { return logger_ != nullptr; }

    static void info(Component component, const std::string& message);
    static void warn(Component component, const std::string& message);
    static void error(Component component, const std::string& message);
    static void debug(Component component, const std::string& message);

    // Single-string callback that writes INFO lines tagged [Request]
    static std::function<void(const std::string&)> request_sink();

    static std::string_view component_name(Component component);

    // DEBUG|INFO|WARN|ERROR in any case; anything else maps to INFO
    static spdlog::level::level_enum parse_level(const std::string& level);

private:
    static void log(spdlog::level::level_enum level, Component component, const std::string& message);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rproxy
