#include <gtest/gtest.h>
#include <boxhunt/crawl/robots.hpp>
#include "fake_http_client.hpp"

using namespace boxhunt;
using namespace boxhunt::crawl;

static const std::string UA = "BoxHunt/1.0 (Image Scraper for Research Purposes)";

// ============================================================================
// Parsing and matching
// ============================================================================

TEST(RobotsRulesTest, ProductToken) {
    EXPECT_EQ(product_token(UA), "boxhunt");
    EXPECT_EQ(product_token("Googlebot"), "googlebot");
}

TEST(RobotsRulesTest, WildcardGroup) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /private/\n"
        "Disallow: /tmp\n", UA);

    EXPECT_TRUE(rules.is_allowed("/"));
    EXPECT_TRUE(rules.is_allowed("/gallery/box.jpg"));
    EXPECT_FALSE(rules.is_allowed("/private/box.jpg"));
    EXPECT_FALSE(rules.is_allowed("/tmp"));
    EXPECT_FALSE(rules.is_allowed("/tmp/x"));
    EXPECT_TRUE(rules.is_allowed("/robots.txt"));
}

TEST(RobotsRulesTest, SpecificGroupWinsOverWildcard) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /\n"
        "\n"
        "User-agent: boxhunt\n"
        "Disallow: /admin\n", UA);

    EXPECT_TRUE(rules.is_allowed("/gallery"));
    EXPECT_FALSE(rules.is_allowed("/admin/panel"));
}

TEST(RobotsRulesTest, ConsecutiveAgentsShareGroup) {
    auto rules = RobotsRules::parse(
        "User-agent: otherbot\n"
        "User-agent: BoxHunt\n"
        "Disallow: /shared\n"
        "User-agent: thirdbot\n"
        "Disallow: /third\n", UA);

    EXPECT_FALSE(rules.is_allowed("/shared"));
    EXPECT_TRUE(rules.is_allowed("/third"));
}

TEST(RobotsRulesTest, LongestMatchWinsAndTiesAllow) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /shop\n"
        "Allow: /shop/boxes\n"
        "Disallow: /same\n"
        "Allow: /same\n", UA);

    EXPECT_FALSE(rules.is_allowed("/shop/cart"));
    EXPECT_TRUE(rules.is_allowed("/shop/boxes/1.jpg"));
    EXPECT_TRUE(rules.is_allowed("/same/page"));
}

TEST(RobotsRulesTest, WildcardsAndAnchors) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /*.gif$\n"
        "Disallow: /*?session=\n", UA);

    EXPECT_FALSE(rules.is_allowed("/img/a.gif"));
    EXPECT_TRUE(rules.is_allowed("/img/a.gif.html"));
    EXPECT_FALSE(rules.is_allowed("/list?session=42"));
    EXPECT_TRUE(rules.is_allowed("/list?page=2"));
}

TEST(RobotsRulesTest, EmptyDisallowAndCommentsIgnored) {
    auto rules = RobotsRules::parse(
        "# comment\n"
        "User-agent: *   # everyone\n"
        "Disallow:\n"
        "Crawl-delay: 10\n", UA);

    EXPECT_EQ(rules.rule_count(), 0u);
    EXPECT_TRUE(rules.is_allowed("/anything"));
}

// ============================================================================
// Cache
// ============================================================================

TEST(RobotsCacheTest, FetchesOncePerHost) {
    boxhunt::testing::FakeHttpClient http;
    http.serve("https://example.test/robots.txt", 200, "User-agent: *\nDisallow: /private\n",
               "text/plain");

    RobotsCache cache(&http, UA, 5000);
    EXPECT_TRUE(cache.is_allowed("https://example.test/gallery"));
    EXPECT_FALSE(cache.is_allowed("https://example.test/private/a"));
    EXPECT_TRUE(cache.is_allowed("https://example.test/?q=1"));

    EXPECT_EQ(http.request_count("https://example.test/robots.txt"), 1u);
    EXPECT_EQ(cache.cached_hosts(), 1u);
}

TEST(RobotsCacheTest, MissingOrFailingRobotsAllowsAll) {
    boxhunt::testing::FakeHttpClient http;
    http.fail("https://down.test/robots.txt", Error(ErrorCode::TIMEOUT, "timed out"));
    http.serve("https://error.test/robots.txt", 500, "Disallow: /", "text/plain");

    RobotsCache cache(&http, UA, 5000);
    EXPECT_TRUE(cache.is_allowed("https://missing.test/private"));
    EXPECT_TRUE(cache.is_allowed("https://down.test/private"));
    EXPECT_TRUE(cache.is_allowed("https://error.test/private"));
    EXPECT_EQ(cache.cached_hosts(), 3u);
}

TEST(RobotsCacheTest, RejectsNonHttpUrls) {
    boxhunt::testing::FakeHttpClient http;
    RobotsCache cache(&http, UA, 5000);
    EXPECT_FALSE(cache.is_allowed("ftp://example.test/file"));
    EXPECT_EQ(http.total_requests(), 0u);
}
