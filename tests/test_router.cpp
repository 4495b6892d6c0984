#include <gtest/gtest.h>
#include "router.hpp"

using namespace rproxy;

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        api = std::make_shared<Pool>("api");
        web = std::make_shared<Pool>("web");
    }

    static httplib::Request make_request(const std::string& method, const std::string& path) {
        httplib::Request req;
        req.method = method;
        req.path = path;
        return req;
    }

    static Route make_route(const std::string& name, std::shared_ptr<Pool> backend, int priority) {
        Route route;
        route.name = name;
        route.backend = std::move(backend);
        route.priority = priority;
        return route;
    }

    std::shared_ptr<Pool> api;
    std::shared_ptr<Pool> web;
    Router router;
};

TEST_F(RouterTest, EmptyRouterMatchesNothing) {
    EXPECT_EQ(router.match(make_request("GET", "/")), nullptr);
    EXPECT_EQ(router.size(), 0);
}

TEST_F(RouterTest, HigherPriorityWins) {
    Route low = make_route("low", web, 10);
    low.path_prefix = "/api";
    Route high = make_route("high", api, 20);
    high.path_prefix = "/api";

    ASSERT_TRUE(router.add_route(low).has_value());
    ASSERT_TRUE(router.add_route(high).has_value());

    auto route = router.match(make_request("GET", "/api/users"));
    ASSERT_NE(route, nullptr);
    EXPECT_EQ(route->name, "high");
    EXPECT_EQ(route->backend, api);
}

TEST_F(RouterTest, TiesKeepInsertionOrder) {
    ASSERT_TRUE(router.add_route(make_route("first", api, 5)).has_value());
    ASSERT_TRUE(router.add_route(make_route("second", web, 5)).has_value());

    auto route = router.match(make_request("GET", "/anything"));
    ASSERT_NE(route, nullptr);
    EXPECT_EQ(route->name, "first");

    auto routes = router.list_routes();
    ASSERT_EQ(routes.size(), 2);
    EXPECT_EQ(routes[0]->name, "first");
    EXPECT_EQ(routes[1]->name, "second");
}

TEST_F(RouterTest, PathPrefixAndMethods) {
    Route route = make_route("users", api, 0);
    route.path_prefix = "/api/users";
    route.methods = {"GET", "POST"};
    ASSERT_TRUE(router.add_route(route).has_value());

    EXPECT_NE(router.match(make_request("GET", "/api/users/42")), nullptr);
    EXPECT_NE(router.match(make_request("POST", "/api/users")), nullptr);
    EXPECT_EQ(router.match(make_request("DELETE", "/api/users")), nullptr);
    EXPECT_EQ(router.match(make_request("GET", "/api/orders")), nullptr);
}

TEST_F(RouterTest, PatternIsSearchedInPath) {
    Route route = make_route("numeric", api, 0);
    route.pattern = "/items/[0-9]+";
    ASSERT_TRUE(router.add_route(route).has_value());

    EXPECT_NE(router.match(make_request("GET", "/v2/items/17")), nullptr);
    EXPECT_EQ(router.match(make_request("GET", "/v2/items/abc")), nullptr);
}

TEST_F(RouterTest, SubdomainAndHeaders) {
    Route route = make_route("tenant", api, 0);
    route.subdomain = "acme";
    route.headers = {{"X-Tenant", "acme"}};
    ASSERT_TRUE(router.add_route(route).has_value());

    auto req = make_request("GET", "/");
    req.set_header("Host", "acme.example.com:9000");
    EXPECT_EQ(router.match(req), nullptr);

    req.set_header("X-Tenant", "acme");
    EXPECT_NE(router.match(req), nullptr);

    auto other = make_request("GET", "/");
    other.set_header("Host", "globex.example.com");
    other.set_header("X-Tenant", "acme");
    EXPECT_EQ(router.match(other), nullptr);
}

TEST_F(RouterTest, BadPatternIsRejected) {
    Route route = make_route("broken", api, 0);
    route.pattern = "([unclosed";

    auto result = router.add_route(route);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidPattern);
    EXPECT_EQ(router.size(), 0);
}

TEST_F(RouterTest, RemoveRoute) {
    ASSERT_TRUE(router.add_route(make_route("a", api, 1)).has_value());
    ASSERT_TRUE(router.add_route(make_route("b", web, 0)).has_value());

    EXPECT_TRUE(router.remove_route("a"));
    EXPECT_FALSE(router.remove_route("a"));
    EXPECT_EQ(router.size(), 1);
    EXPECT_EQ(router.match(make_request("GET", "/"))->name, "b");
}

TEST_F(RouterTest, ContentTypeRouting) {
    ContentRouter content_router;
    ContentRouter::ContentTypeRoutes routes = {
        {"application/json", api},
        {"text/html", web}
    };

    auto req = make_request("POST", "/upload");
    req.set_header("Content-Type", "application/json");
    EXPECT_EQ(content_router.route_by_content_type(req, routes), api);

    req.set_header("Content-Type", "application/xml");
    EXPECT_EQ(content_router.route_by_content_type(req, routes), nullptr);

    EXPECT_EQ(content_router.router().size(), 0);
}
