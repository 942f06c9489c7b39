#include <gtest/gtest.h>
#include <boxhunt/net/url.hpp>

using namespace boxhunt::net;

// ============================================================================
// Parsing
// ============================================================================

TEST(UrlTest, ParseComponents) {
    auto url = parse_url("HTTPS://user@Example.TEST:8443/a/b?x=1#frag");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->userinfo, "user");
    EXPECT_EQ(url->host, "example.test");
    EXPECT_EQ(url->port, "8443");
    EXPECT_EQ(url->path, "/a/b");
    EXPECT_EQ(url->query, "x=1");
    EXPECT_EQ(url->fragment, "frag");
    EXPECT_EQ(url->netloc(), "example.test:8443");
}

TEST(UrlTest, DefaultPortOmittedFromNetloc) {
    auto url = parse_url("http://example.test:80/");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->netloc(), "example.test");
}

TEST(UrlTest, RejectsNonNumericPort) {
    EXPECT_FALSE(parse_url("http://example.test:abc/").has_value());
}

// ============================================================================
// Resolution (RFC 3986 section 5.4 examples)
// ============================================================================

TEST(UrlTest, ResolveNormalExamples) {
    const std::string base = "http://a/b/c/d;p?q";
    EXPECT_EQ(resolve_url(base, "g").value(), "http://a/b/c/g");
    EXPECT_EQ(resolve_url(base, "./g").value(), "http://a/b/c/g");
    EXPECT_EQ(resolve_url(base, "g/").value(), "http://a/b/c/g/");
    EXPECT_EQ(resolve_url(base, "/g").value(), "http://a/g");
    EXPECT_EQ(resolve_url(base, "//g").value(), "http://g/");
    EXPECT_EQ(resolve_url(base, "?y").value(), "http://a/b/c/d;p?y");
    EXPECT_EQ(resolve_url(base, "g?y").value(), "http://a/b/c/g?y");
    EXPECT_EQ(resolve_url(base, "#s").value(), "http://a/b/c/d;p?q#s");
    EXPECT_EQ(resolve_url(base, "..").value(), "http://a/b/");
    EXPECT_EQ(resolve_url(base, "../g").value(), "http://a/b/g");
    EXPECT_EQ(resolve_url(base, "../../g").value(), "http://a/g");
    EXPECT_EQ(resolve_url(base, "../../../g").value(), "http://a/g");
}

TEST(UrlTest, ResolveRequiresAbsoluteBase) {
    EXPECT_FALSE(resolve_url("/relative/page", "img.png").has_value());
}

// ============================================================================
// Link normalization
// ============================================================================

TEST(UrlTest, NormalizeLinkResolvesAndDropsFragment) {
    auto link = normalize_link("https://example.test/gallery/index.html", "  ../img/box.jpg#top ");
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(*link, "https://example.test/img/box.jpg");
}

TEST(UrlTest, NormalizeLinkRejectsNonCrawlable) {
    const std::string page = "https://example.test/";
    EXPECT_FALSE(normalize_link(page, "").has_value());
    EXPECT_FALSE(normalize_link(page, "#section").has_value());
    EXPECT_FALSE(normalize_link(page, "data:image/png;base64,AAAA").has_value());
    EXPECT_FALSE(normalize_link(page, "javascript:void(0)").has_value());
    EXPECT_FALSE(normalize_link(page, "mailto:someone@example.test").has_value());
    EXPECT_FALSE(normalize_link(page, "/docs/catalog.PDF").has_value());
    EXPECT_FALSE(normalize_link(page, "ftp://example.test/file.jpg").has_value());
}

TEST(UrlTest, NormalizeLinkEscapesSpaces) {
    auto link = normalize_link("https://example.test/", "/photos/brown box.jpg");
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(*link, "https://example.test/photos/brown%20box.jpg");
}

// ============================================================================
// Host helpers
// ============================================================================

TEST(UrlTest, SameHostIsPortAware) {
    EXPECT_TRUE(same_host("https://Example.test/a", "https://example.test:443/b"));
    EXPECT_FALSE(same_host("https://example.test/a", "https://example.test:8443/a"));
    EXPECT_FALSE(same_host("https://example.test/a", "https://cdn.example.test/a"));
}

TEST(UrlTest, SiteLabelAndCollectionDomain) {
    EXPECT_EQ(site_label("https://www.Deprintedbox.com:8080/shop"), "deprintedbox");
    EXPECT_EQ(collection_domain("https://www.Deprintedbox.com:8080/shop"), "deprintedbox.com");
    EXPECT_EQ(site_label("http://localhost/"), "localhost");
    EXPECT_EQ(site_label("not a url"), "");
}

TEST(UrlTest, BuildQueryEncodesValues) {
    EXPECT_EQ(build_query({{"query", "cardboard box"}, {"per_page", "20"}}),
              "query=cardboard%20box&per_page=20");
    EXPECT_EQ(url_encode("纸箱"), "%E7%BA%B8%E7%AE%B1");
}
