#include "resilink/server/Router.hpp"

#include <gtest/gtest.h>

using namespace resilink;

namespace {

server::Router::Handler tagging(std::string& hit, std::string tag) {
    return [&hit, tag](server::RequestContext&) { hit = tag; };
}

} // namespace

TEST(RouterTest, CapturesPathParameters) {
    server::Router router;
    std::string hit;
    router.addRoute("GET", "/api/queue/stats", tagging(hit, "all"));
    router.addRoute("GET", "/api/queue/stats/:provider", tagging(hit, "one"));

    std::unordered_map<std::string, std::string> params;
    auto handler = router.resolve("GET", "/api/queue/stats/oddsAPI", params);
    ASSERT_TRUE(handler);
    server::RequestContext ctx;
    handler(ctx);
    EXPECT_EQ(hit, "one");
    EXPECT_EQ(params.at("provider"), "oddsAPI");

    handler = router.resolve("get", "/api/queue/stats/", params);
    ASSERT_TRUE(handler);
    handler(ctx);
    EXPECT_EQ(hit, "all");
    EXPECT_TRUE(params.empty());
}

TEST(RouterTest, IgnoresQueryString) {
    server::Router router;
    std::string hit;
    router.addRoute("GET", "/health", tagging(hit, "health"));

    std::unordered_map<std::string, std::string> params;
    EXPECT_TRUE(router.resolve("GET", "/health?verbose=1", params));
}

TEST(RouterTest, MethodAndPathMustMatch) {
    server::Router router;
    std::string hit;
    router.addRoute("GET", "/api/cache/stats", tagging(hit, "cache"));

    std::unordered_map<std::string, std::string> params;
    EXPECT_FALSE(router.resolve("POST", "/api/cache/stats", params));
    EXPECT_FALSE(router.resolve("GET", "/api/cache", params));
    EXPECT_FALSE(router.resolve("GET", "/api/cache/stats/extra", params));
}

TEST(RouterTest, LiteralSegmentsAreNotPatterns) {
    server::Router router;
    std::string hit;
    router.addRoute("GET", "/v1.0/status", tagging(hit, "status"));

    std::unordered_map<std::string, std::string> params;
    EXPECT_TRUE(router.resolve("GET", "/v1.0/status", params));
    EXPECT_FALSE(router.resolve("GET", "/v1x0/status", params));
}
