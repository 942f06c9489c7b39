#include <gtest/gtest.h>
#include <boxhunt/net/http_client.hpp>

using namespace boxhunt;
using namespace boxhunt::net;

// ============================================================================
// Header collection
// ============================================================================

TEST(HeaderCollectorTest, KeepsOnlyFinalResponseHeaders) {
    HttpResponse response;
    HeaderCollector headers(&response, 0);

    EXPECT_TRUE(headers.feed("HTTP/1.1 301 Moved Permanently\r\n"));
    EXPECT_TRUE(headers.feed("Location: https://cdn.test/box.jpg\r\n"));
    EXPECT_TRUE(headers.feed("\r\n"));
    EXPECT_EQ(headers.block_status(), 301);

    EXPECT_TRUE(headers.feed("HTTP/2 200\r\n"));
    EXPECT_TRUE(headers.feed("Content-Type:  image/jpeg \r\n"));
    EXPECT_TRUE(headers.feed("\r\n"));

    EXPECT_EQ(headers.block_status(), 200);
    EXPECT_EQ(response.header("location"), "");
    EXPECT_EQ(response.content_type(), "image/jpeg");
}

TEST(HeaderCollectorTest, DeclaredLengthAboveCapAborts) {
    HttpResponse response;
    HeaderCollector headers(&response, 1000);

    EXPECT_TRUE(headers.feed("HTTP/1.1 200 OK\r\n"));
    EXPECT_TRUE(headers.feed("Content-Length: 1000\r\n"));
    EXPECT_FALSE(headers.feed("Content-Length: 1001\r\n"));
}

TEST(HeaderCollectorTest, RedirectLengthIsNotCapped) {
    HttpResponse response;
    HeaderCollector headers(&response, 1000);

    EXPECT_TRUE(headers.feed("HTTP/1.1 302 Found\r\n"));
    EXPECT_TRUE(headers.feed("Content-Length: 50000\r\n"));
    EXPECT_TRUE(headers.feed("\r\n"));

    EXPECT_TRUE(headers.feed("HTTP/1.1 200 OK\r\n"));
    EXPECT_TRUE(headers.feed("Content-Length: 800\r\n"));
    EXPECT_EQ(response.content_length(), 800);
}

TEST(HeaderCollectorTest, NoCapWhenUnlimited) {
    HttpResponse response;
    HeaderCollector headers(&response, 0);

    EXPECT_TRUE(headers.feed("HTTP/1.1 200 OK\r\n"));
    EXPECT_TRUE(headers.feed("Content-Length: 99999999999\r\n"));
    EXPECT_EQ(response.content_length(), 99999999999LL);
}

// ============================================================================
// Status mapping
// ============================================================================

TEST(StatusErrorTest, MapsCommonStatuses) {
    EXPECT_EQ(status_error(401, "x").code(), ErrorCode::AUTH_ERROR);
    EXPECT_EQ(status_error(403, "x").code(), ErrorCode::AUTH_ERROR);
    EXPECT_EQ(status_error(404, "x").code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(status_error(429, "x").code(), ErrorCode::RATE_LIMITED);
    EXPECT_EQ(status_error(500, "x").code(), ErrorCode::HTTP_ERROR);
}
