#include "config_loader.hpp"
#include "logger.hpp"
#include "proxy_runtime.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

using namespace rproxy;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_path = argc > 1 ? argv[1] : "config.json";

    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    Logger::init(config.server.log_file, config.server.log_level);
    Logger::info(Logger::Component::Config,
        fmt::format("Config loaded: {} backends, {} routes",
            config.backends.size(), config.routes.size()));

    if (config.server.tls) {
        Logger::warn(Logger::Component::Proxy,
            "TLS is configured but not terminated by this proxy; serving plain HTTP");
    }

    ProxyRuntime runtime = build_runtime(config);
    std::shared_ptr<ProxyEngine> engine = runtime.engine;

    httplib::Server server;
    server.set_read_timeout(5, 0);
    server.set_write_timeout(5, 0);

    // Admin endpoints are registered first so they win over the catch-all
    server.Get("/__proxy/stats", [engine](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = engine->get_stats();
        res.set_content(body.dump(), "application/json");
    });

    server.Post("/__proxy/cache/clear", [engine](const httplib::Request&, httplib::Response& res) {
        engine->clear_cache();
        res.set_content(R"({"status": "cleared"})", "application/json");
    });

    auto proxy_handler = [engine](const httplib::Request& req, httplib::Response& res) {
        engine->handle(req, res);
    };

    server.Get(".*", proxy_handler);
    server.Post(".*", proxy_handler);
    server.Put(".*", proxy_handler);
    server.Patch(".*", proxy_handler);
    server.Delete(".*", proxy_handler);
    server.Options(".*", proxy_handler);

    Logger::info(Logger::Component::Proxy,
        fmt::format("Starting reverse proxy on {}:{}", config.server.host, config.server.port));

    std::cout << fmt::format("Reverse proxy started on {}:{}\n", config.server.host, config.server.port);
    std::cout << "Press Ctrl+C to stop\n";

    std::atomic<bool> listen_failed{false};
    std::thread server_thread([&]() {
        if (!server.listen(config.server.host, config.server.port)) {
            listen_failed.store(true);
            shutdown_requested.store(true);
        }
    });

    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down gracefully...\n";
    Logger::info(Logger::Component::Proxy, "Shutting down gracefully");

    server.stop();
    runtime.stop();

    if (server_thread.joinable()) {
        server_thread.join();
    }

    if (listen_failed.load()) {
        Logger::error(Logger::Component::Proxy,
            fmt::format("Could not listen on {}:{}", config.server.host, config.server.port));
    }

    Logger::shutdown();

    std::cout << "Shutdown complete\n";
    return listen_failed.load() ? 1 : 0;
}
