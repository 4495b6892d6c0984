#include <gtest/gtest.h>
#include "proxy_engine.hpp"
#include <algorithm>
#include <condition_variable>
#include <thread>

using namespace rproxy;
using namespace std::chrono_literals;

class ProxyEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend.Get("/api/users", [this](const httplib::Request& req, httplib::Response& res) {
            hits.fetch_add(1);
            {
                std::lock_guard<std::mutex> lock(seen_mutex);
                seen_forwarded_for = req.get_header_value("X-Forwarded-For");
                seen_forwarded_proto = req.get_header_value("X-Forwarded-Proto");
                seen_real_ip = req.get_header_value("X-Real-IP");
                seen_query = req.get_param_value("page");
            }
            res.set_header("X-Backend", "users");
            res.set_content(R"([{"id":1}])", "application/json");
        });
        backend.Get("/v1/items", [this](const httplib::Request&, httplib::Response& res) {
            hits.fetch_add(1);
            res.set_content("items", "text/plain");
        });
        backend.Post("/api/users", [this](const httplib::Request& req, httplib::Response& res) {
            hits.fetch_add(1);
            res.status = 201;
            res.set_content(req.body, "application/json");
        });

        port = backend.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        backend_thread = std::thread([this] { backend.listen_after_bind(); });
        backend.wait_until_ready();

        pool = std::make_shared<Pool>("api");
        auto server = pool->add_server("http://127.0.0.1:" + std::to_string(port));
        ASSERT_TRUE(server.has_value());

        Route route;
        route.name = "api";
        route.path_prefix = "/api";
        route.backend = pool;
        ASSERT_TRUE(engine.add_route(route).has_value());

        engine.set_upstream_timeout(2s);
    }

    void TearDown() override {
        backend.stop();
        if (backend_thread.joinable()) {
            backend_thread.join();
        }
    }

    static httplib::Request make_request(const std::string& method, const std::string& path,
                                         const std::string& remote = "10.0.0.1") {
        httplib::Request req;
        req.method = method;
        req.path = path;
        req.remote_addr = remote;
        return req;
    }

    httplib::Response send(const httplib::Request& req) {
        httplib::Response res;
        engine.handle(req, res);
        return res;
    }

    httplib::Server backend;
    std::thread backend_thread;
    int port = 0;
    std::atomic<int> hits{0};

    std::mutex seen_mutex;
    std::string seen_forwarded_for;
    std::string seen_forwarded_proto;
    std::string seen_real_ip;
    std::string seen_query;

    std::shared_ptr<Pool> pool;
    ProxyEngine engine;
};

TEST_F(ProxyEngineTest, ForwardsToBackend) {
    auto res = send(make_request("GET", "/api/users"));
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, R"([{"id":1}])");
    EXPECT_EQ(res.get_header_value("X-Backend"), "users");
    EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");
    EXPECT_EQ(hits.load(), 1);
}

TEST_F(ProxyEngineTest, ForwardsBodyAndStatus) {
    auto req = make_request("POST", "/api/users");
    req.body = R"({"name":"ada"})";
    req.set_header("Content-Type", "application/json");

    auto res = send(req);
    EXPECT_EQ(res.status, 201);
    EXPECT_EQ(res.body, R"({"name":"ada"})");
}

TEST_F(ProxyEngineTest, SetsForwardingHeadersAndQuery) {
    auto req = make_request("GET", "/api/users", "192.168.5.5");
    req.params.emplace("page", "2");

    auto res = send(req);
    ASSERT_EQ(res.status, 200);

    std::lock_guard<std::mutex> lock(seen_mutex);
    EXPECT_EQ(seen_forwarded_for, "192.168.5.5");
    EXPECT_EQ(seen_forwarded_proto, "http");
    EXPECT_EQ(seen_real_ip, "192.168.5.5");
    EXPECT_EQ(seen_query, "2");
}

TEST_F(ProxyEngineTest, ForwardedForKeepsOriginalClient) {
    auto req = make_request("GET", "/api/users", "10.0.0.2");
    req.set_header("X-Forwarded-For", "203.0.113.9, 10.0.0.2");
    req.set_header("X-Forwarded-Proto", "https");

    ASSERT_EQ(send(req).status, 200);

    std::lock_guard<std::mutex> lock(seen_mutex);
    EXPECT_EQ(seen_forwarded_for, "203.0.113.9");
    EXPECT_EQ(seen_forwarded_proto, "https");
    EXPECT_EQ(seen_real_ip, "10.0.0.2");
}

TEST_F(ProxyEngineTest, ServerBasePathIsPrepended) {
    auto items = std::make_shared<Pool>("items");
    ASSERT_TRUE(items->add_server("http://127.0.0.1:" + std::to_string(port) + "/v1").has_value());

    Route route;
    route.name = "items";
    route.path_prefix = "/items";
    route.backend = items;
    ASSERT_TRUE(engine.add_route(route).has_value());

    auto res = send(make_request("GET", "/items"));
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "items");
}

TEST_F(ProxyEngineTest, NoRouteIs404) {
    auto res = send(make_request("GET", "/nope"));
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(hits.load(), 0);
    EXPECT_EQ(engine.get_stats().error_count, 1);
}

TEST_F(ProxyEngineTest, NoHealthyServerIs503) {
    Pool::set_health(*pool->get_server_by_index(0), false);
    auto res = send(make_request("GET", "/api/users"));
    EXPECT_EQ(res.status, 503);
    EXPECT_EQ(hits.load(), 0);
}

TEST_F(ProxyEngineTest, UnreachableBackendIs502) {
    auto dead = std::make_shared<Pool>("dead");
    ASSERT_TRUE(dead->add_server("http://127.0.0.1:1").has_value());

    Route route;
    route.name = "dead";
    route.path_prefix = "/dead";
    route.backend = dead;
    ASSERT_TRUE(engine.add_route(route).has_value());

    auto res = send(make_request("GET", "/dead"));
    EXPECT_EQ(res.status, 502);
    EXPECT_TRUE(res.body.starts_with("Bad Gateway"));
}

TEST_F(ProxyEngineTest, RateLimitIs429) {
    engine.set_rate_limit(1, 1min);

    EXPECT_EQ(send(make_request("GET", "/api/users")).status, 200);
    EXPECT_EQ(send(make_request("GET", "/api/users")).status, 200);
    EXPECT_EQ(send(make_request("GET", "/api/users")).status, 429);

    // another client has its own bucket
    EXPECT_EQ(send(make_request("GET", "/api/users", "10.9.9.9")).status, 200);
}

TEST_F(ProxyEngineTest, MiddlewareRejectionDefaultsTo403) {
    engine.add_middleware([](const httplib::Request&, httplib::Response&) -> std::expected<MiddlewareResult, Error> {
        return std::unexpected(Error{ErrorCode::Forbidden, "blocked"});
    });

    auto res = send(make_request("GET", "/api/users"));
    EXPECT_EQ(res.status, 403);
    EXPECT_EQ(hits.load(), 0);
}

TEST_F(ProxyEngineTest, MiddlewareStatusIsKept) {
    engine.add_middleware(AuthMiddleware(AuthMiddleware::bearer_validator("s3cret")));

    EXPECT_EQ(send(make_request("GET", "/api/users")).status, 401);

    auto wrong = make_request("GET", "/api/users");
    wrong.set_header("Authorization", "Bearer nope");
    EXPECT_EQ(send(wrong).status, 403);

    auto good = make_request("GET", "/api/users");
    good.set_header("Authorization", "Bearer s3cret");
    EXPECT_EQ(send(good).status, 200);
    EXPECT_EQ(engine.get_stats().error_count, 2);
}

TEST_F(ProxyEngineTest, PreflightNeverReachesBackend) {
    engine.add_middleware(CorsMiddleware({"*"}));

    auto req = make_request("OPTIONS", "/api/users");
    req.set_header("Origin", "https://app.example");
    auto res = send(req);

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "https://app.example");
    EXPECT_EQ(hits.load(), 0);
}

TEST_F(ProxyEngineTest, MiddlewareHeadersSurviveForwarding) {
    engine.add_middleware(CorsMiddleware({"*"}));

    auto req = make_request("GET", "/api/users");
    req.set_header("Origin", "https://app.example");
    auto res = send(req);

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, R"([{"id":1}])");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "https://app.example");
    EXPECT_FALSE(res.get_header_value("Access-Control-Allow-Methods").empty());
    EXPECT_EQ(res.get_header_value("X-Backend"), "users");
    EXPECT_EQ(hits.load(), 1);
}

TEST_F(ProxyEngineTest, CachesWhenPolicyEnabled) {
    CachePolicyConfig policy;
    policy.enabled = true;
    policy.ttl = 1min;
    engine.set_cache_policy(policy);

    auto first = send(make_request("GET", "/api/users"));
    EXPECT_EQ(first.status, 200);
    EXPECT_FALSE(first.has_header("X-Cache"));

    auto second = send(make_request("GET", "/api/users"));
    EXPECT_EQ(second.status, 200);
    EXPECT_EQ(second.get_header_value("X-Cache"), "HIT");
    EXPECT_EQ(second.body, R"([{"id":1}])");
    EXPECT_EQ(hits.load(), 1);
    EXPECT_EQ(engine.get_stats().cache_size, 1);

    engine.clear_cache();
    EXPECT_EQ(engine.get_stats().cache_size, 0);
    EXPECT_EQ(send(make_request("GET", "/api/users")).status, 200);
    EXPECT_EQ(hits.load(), 2);
}

TEST_F(ProxyEngineTest, NoCachingByDefault) {
    send(make_request("GET", "/api/users"));
    send(make_request("GET", "/api/users"));
    EXPECT_EQ(hits.load(), 2);
    EXPECT_EQ(engine.get_stats().cache_size, 0);
}

TEST_F(ProxyEngineTest, ManuallyCachedResponseIsServed) {
    auto req = make_request("GET", "/api/users");
    auto server = pool->get_server_by_index(0);
    engine.cache_response(req, *server, 200, {{"Content-Type", "text/plain"}}, "from cache", 1min);

    auto res = send(req);
    EXPECT_EQ(res.body, "from cache");
    EXPECT_EQ(res.get_header_value("X-Cache"), "HIT");
    EXPECT_EQ(hits.load(), 0);
}

TEST_F(ProxyEngineTest, CircuitOpensAfterFailures) {
    auto dead = std::make_shared<Pool>("dead");
    ASSERT_TRUE(dead->add_server("http://127.0.0.1:1").has_value());

    Route route;
    route.name = "dead";
    route.path_prefix = "/dead";
    route.backend = dead;
    ASSERT_TRUE(engine.add_route(route).has_value());

    CircuitBreakerPolicy policy;
    policy.enabled = true;
    policy.failure_threshold = 1;
    policy.success_threshold = 1;
    policy.timeout = 1min;
    engine.set_circuit_breaker_policy(policy);

    EXPECT_EQ(send(make_request("GET", "/dead")).status, 502);
    EXPECT_EQ(send(make_request("GET", "/dead")).status, 503);

    auto breaker = engine.breaker_for(*dead->get_server_by_index(0));
    ASSERT_NE(breaker, nullptr);
    EXPECT_EQ(breaker->state(), CircuitState::Open);
}

TEST_F(ProxyEngineTest, BreakerDisabledByDefault) {
    EXPECT_EQ(engine.breaker_for(*pool->get_server_by_index(0)), nullptr);
}

TEST_F(ProxyEngineTest, StatsCountRequestsAndErrors) {
    send(make_request("GET", "/api/users"));
    send(make_request("GET", "/missing"));

    ProxyStats stats = engine.get_stats();
    EXPECT_EQ(stats.request_count, 2);
    EXPECT_EQ(stats.error_count, 1);

    nlohmann::json j = stats;
    EXPECT_EQ(j["request_count"], 2);
    EXPECT_EQ(j["error_count"], 1);
    EXPECT_EQ(j["cache_size"], 0);
}

TEST_F(ProxyEngineTest, HandleDoesNotWaitForEventHandlers) {
    struct Gate {
        std::mutex mutex;
        std::condition_variable cv;
        bool entered = false;
        bool released = false;
    };
    auto gate = std::make_shared<Gate>();

    engine.on(events::kNoRouteFound, [gate](const Event&) {
        std::unique_lock lock(gate->mutex);
        gate->entered = true;
        gate->cv.notify_all();
        gate->cv.wait(lock, [&gate] { return gate->released; });
    });

    auto res = send(make_request("GET", "/nope"));
    EXPECT_EQ(res.status, 404);

    {
        std::unique_lock lock(gate->mutex);
        EXPECT_TRUE(gate->cv.wait_for(lock, 2s, [&gate] { return gate->entered; }));
        EXPECT_FALSE(gate->released);
    }

    // still answered while the handler sits blocked
    EXPECT_EQ(send(make_request("GET", "/api/users")).status, 200);

    {
        std::lock_guard<std::mutex> lock(gate->mutex);
        gate->released = true;
    }
    gate->cv.notify_all();
}

TEST_F(ProxyEngineTest, EmitsLifecycleEvents) {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> received;

    auto record = [&](const Event& event) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            received.push_back(event.type + ":" + std::to_string(event.status));
        }
        cv.notify_all();
    };
    engine.on(events::kNoRouteFound, record);
    engine.on(events::kRequestForwarded, record);

    send(make_request("GET", "/nope"));
    send(make_request("GET", "/api/users"));

    std::unique_lock lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, 2s, [&] { return received.size() >= 2; }));
    EXPECT_NE(std::find(received.begin(), received.end(), "no_route_found:404"), received.end());
    EXPECT_NE(std::find(received.begin(), received.end(), "request_forwarded:0"), received.end());
}
