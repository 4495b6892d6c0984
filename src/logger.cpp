#include "logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace rproxy {

namespace {

constexpr size_t kMaxLogFileSize = 10 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 5;

constexpr std::array<std::string_view, 11> kComponentNames = {
    "Proxy", "Config", "HealthCheck", "Request", "Router", "Response",
    "Backend", "Cache", "RateLimit", "Events", "Traffic"
};

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& log_file, const std::string& log_level) {
    const auto level = parse_level(log_level);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(std::max(level, spdlog::level::info));

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        if (!log_file.empty()) {
            std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
            std::error_code ec;
            if (!log_dir.empty()) {
                std::filesystem::create_directories(log_dir, ec);
            }

            if (ec) {
                std::cerr << "Could not create log directory " << log_dir
                          << ": " << ec.message() << ", logging to console only" << std::endl;
            } else {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file, kMaxLogFileSize, kMaxLogFiles);
                file_sink->set_level(level);
                sinks.push_back(std::move(file_sink));
            }
        }

        logger_ = std::make_shared<spdlog::logger>("reverse-proxy", sinks.begin(), sinks.end());
        logger_->set_level(level);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop_all();
    }
}

void Logger::log(spdlog::level::level_enum level, Component component, const std::string& message) {
    if (logger_) {
        logger_->log(level, "[{}] {}", component_name(component), message);
    }
}

void Logger::info(Component component, const std::string& message) {
    log(spdlog::level::info, component, message);
}

void Logger::warn(Component component, const std::string& message) {
    log(spdlog::level::warn, component, message);
}

void Logger::error(Component component, const std::string& message) {
    log(spdlog::level::err, component, message);
}

void Logger::debug(Component component, const std::string& message) {
    log(spdlog::level::debug, component, message);
}

std::function<void(const std::string&)> Logger::request_sink() {
    return [](const std::string& line) { info(Component::Request, line); };
}

std::string_view Logger::component_name(Component component) {
    auto index = static_cast<size_t>(component);
    return index < kComponentNames.size() ? kComponentNames[index] : "Unknown";
}

spdlog::level::level_enum Logger::parse_level(const std::string& level) {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace rproxy
