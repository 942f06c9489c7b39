#include <gtest/gtest.h>
#include <boxhunt/crawl/charset.hpp>

using namespace boxhunt::crawl;

// "纸箱" in GBK
static const std::string GBK_BOX = "\xD6\xBD\xCF\xE4";
static const std::string UTF8_BOX = "\xE7\xBA\xB8\xE7\xAE\xB1";

TEST(CharsetTest, CharsetFromContentType) {
    EXPECT_EQ(charset_from_content_type("text/html; charset=UTF-8").value(), "utf-8");
    EXPECT_EQ(charset_from_content_type("text/html;charset=\"GB2312\"").value(), "gb18030");
    EXPECT_EQ(charset_from_content_type("text/html; charset=ISO-8859-1").value(), "windows-1252");
    EXPECT_FALSE(charset_from_content_type("text/html").has_value());
}

TEST(CharsetTest, SniffMetaCharset) {
    std::string html = "<html><head><meta charset=\"gbk\"><title>x</title>";
    EXPECT_EQ(sniff_meta_charset(html).value(), "gb18030");

    std::string http_equiv =
        "<meta http-equiv=\"Content-Type\" content=\"text/html; charset=Shift_JIS\">";
    EXPECT_EQ(sniff_meta_charset(http_equiv).value(), "shift_jis");
}

TEST(CharsetTest, SniffOnlyLooksAtWindow) {
    std::string html(4096, ' ');
    html += "<meta charset=\"gbk\">";
    EXPECT_FALSE(sniff_meta_charset(html).has_value());
}

TEST(CharsetTest, ConvertRejectsInvalidUtf8) {
    EXPECT_FALSE(convert_to_utf8(GBK_BOX, "utf-8").has_value());
    EXPECT_EQ(convert_to_utf8(UTF8_BOX, "utf-8").value(), UTF8_BOX);
}

TEST(CharsetTest, ConvertGbk) {
    auto converted = convert_to_utf8(GBK_BOX, "gb18030");
    ASSERT_TRUE(converted.has_value());
    EXPECT_EQ(*converted, UTF8_BOX);
}

TEST(CharsetTest, DecodeHtmlUsesDeclaredCharset) {
    std::string body = "<p>" + GBK_BOX + "</p>";
    EXPECT_EQ(decode_html(body, "text/html; charset=gbk"), "<p>" + UTF8_BOX + "</p>");
}

TEST(CharsetTest, DecodeHtmlUsesMetaWhenHeaderSilent) {
    std::string body = "<meta charset=\"gb2312\"><p>" + GBK_BOX + "</p>";
    EXPECT_EQ(decode_html(body, "text/html"),
              "<meta charset=\"gb2312\"><p>" + UTF8_BOX + "</p>");
}

TEST(CharsetTest, DecodeHtmlFallsBackFromWrongDeclaration) {
    // Declared UTF-8 but the bytes are GBK: the fallback chain finds gb18030
    std::string body = "<p>" + GBK_BOX + "</p>";
    EXPECT_EQ(decode_html(body, "text/html; charset=utf-8"), "<p>" + UTF8_BOX + "</p>");
}

TEST(CharsetTest, DecodeHtmlStripsBom) {
    EXPECT_EQ(decode_html("\xEF\xBB\xBF<p>ok</p>", ""), "<p>ok</p>");
}

TEST(CharsetTest, LossyUtf8ReplacesInvalidBytes) {
    EXPECT_EQ(lossy_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(lossy_utf8(UTF8_BOX), UTF8_BOX);
}
