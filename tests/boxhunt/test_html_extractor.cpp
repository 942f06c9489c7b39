#include <gtest/gtest.h>
#include <boxhunt/crawl/html_extractor.hpp>

using namespace boxhunt::crawl;

static const std::string PAGE = "https://example.test/gallery/index.html";

// ============================================================================
// Images
// ============================================================================

TEST(HtmlExtractorTest, ImgTagsWithAttributes) {
    const std::string html = R"(
        <html><body>
          <img src="/img/box1.jpg" alt="Brown box" width="640" height="480">
          <img data-src="box2.png" title="Lazy box">
          <img data-lazy-src="https://cdn.example.test/photos/3">
        </body></html>)";

    PageContent page = extract_page(html, PAGE);
    ASSERT_EQ(page.images.size(), 3u);

    EXPECT_EQ(page.images[0].url, "https://example.test/img/box1.jpg");
    EXPECT_EQ(page.images[0].title, "Brown box");
    EXPECT_EQ(page.images[0].width, 640);
    EXPECT_EQ(page.images[0].height, 480);

    EXPECT_EQ(page.images[1].url, "https://example.test/gallery/box2.png");
    EXPECT_EQ(page.images[1].title, "Lazy box");
    EXPECT_EQ(page.images[1].width, 0);

    EXPECT_EQ(page.images[2].url, "https://cdn.example.test/photos/3");
}

TEST(HtmlExtractorTest, PictureSourceSrcset) {
    const std::string html = R"(
        <picture>
          <source srcset="/img/small.webp 480w, /img/large.webp 1080w">
          <img src="/img/fallback.jpg">
        </picture>)";

    PageContent page = extract_page(html, PAGE);
    ASSERT_EQ(page.images.size(), 3u);
    EXPECT_EQ(page.images[0].url, "https://example.test/img/small.webp");
    EXPECT_EQ(page.images[1].url, "https://example.test/img/large.webp");
    EXPECT_EQ(page.images[2].url, "https://example.test/img/fallback.jpg");
}

TEST(HtmlExtractorTest, CssBackgroundImages) {
    const std::string html = R"HTML(
        <html><head><style>
          .hero { BACKGROUND-IMAGE: url('/img/hero.jpg'); }
        </style></head>
        <body><div style="background-image: url(/img/tile.png)"></div></body></html>)HTML";

    PageContent page = extract_page(html, PAGE);
    ASSERT_EQ(page.images.size(), 2u);
    EXPECT_EQ(page.images[0].url, "https://example.test/img/tile.png");
    EXPECT_EQ(page.images[1].url, "https://example.test/img/hero.jpg");
}

TEST(HtmlExtractorTest, SkipsImplausibleAndDuplicateImages) {
    const std::string html = R"(
        <img src="/img/a.jpg">
        <img src="/img/a.jpg#zoom">
        <img src="/scripts/tracker.js">
        <img src="data:image/gif;base64,R0lGOD">
        <img src="">)";

    PageContent page = extract_page(html, PAGE);
    ASSERT_EQ(page.images.size(), 1u);
    EXPECT_EQ(page.images[0].url, "https://example.test/img/a.jpg");
}

TEST(HtmlExtractorTest, LooksLikeImageUrl) {
    EXPECT_TRUE(looks_like_image_url("https://example.test/a/b.JPEG"));
    EXPECT_TRUE(looks_like_image_url("https://example.test/photo/123"));
    EXPECT_TRUE(looks_like_image_url("https://example.test/x.svg?v=2"));
    EXPECT_FALSE(looks_like_image_url("https://example.test/about"));
    EXPECT_FALSE(looks_like_image_url("https://example.test/?file=a.jpg"));
}

// ============================================================================
// Links
// ============================================================================

TEST(HtmlExtractorTest, LinksInDocumentOrder) {
    const std::string html = R"(
        <a href="/page2">Two</a>
        <a href="page3.html#top">Three</a>
        <a href="/page2">Two again</a>
        <a href="mailto:shop@example.test">Mail</a>
        <a href="https://other.test/">Elsewhere</a>
        <a>No href</a>)";

    PageContent page = extract_page(html, PAGE);
    ASSERT_EQ(page.links.size(), 3u);
    EXPECT_EQ(page.links[0], "https://example.test/page2");
    EXPECT_EQ(page.links[1], "https://example.test/gallery/page3.html");
    EXPECT_EQ(page.links[2], "https://other.test/");
}

TEST(HtmlExtractorTest, MalformedHtmlStillParses) {
    const std::string html = "<div><p><img src='/img/box.jpg'><a href='/next'>next";
    PageContent page = extract_page(html, PAGE);
    EXPECT_EQ(page.images.size(), 1u);
    EXPECT_EQ(page.links.size(), 1u);
}

TEST(HtmlExtractorTest, ParseSrcset) {
    auto urls = parse_srcset(" a.jpg 1x,\n b.jpg 2x ,, c.jpg");
    ASSERT_EQ(urls.size(), 3u);
    EXPECT_EQ(urls[0], "a.jpg");
    EXPECT_EQ(urls[1], "b.jpg");
    EXPECT_EQ(urls[2], "c.jpg");
}
