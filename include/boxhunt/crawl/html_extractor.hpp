#pragma once

#include <string>
#include <vector>

namespace boxhunt::crawl {

/**
 * An image reference found on a page, already absolute.
 */
struct ImageRef {
    std::string url;
    std::string title;   // alt, else title attribute
    int width = 0;       // From width/height attributes, 0 if absent
    int height = 0;
};

struct PageContent {
    std::vector<ImageRef> images;      // Document order, unique by url
    std::vector<std::string> links;    // <a href>, absolute, unique, document order
};

/**
 * Plausible-image heuristic on the URL path: a known image extension
 * (.jpg .jpeg .png .gif .webp .bmp .svg) or an image-ish path keyword
 * (image, img, photo, picture, pic).
 */
bool looks_like_image_url(const std::string& url);

/**
 * Parses one HTML document (UTF-8) and collects image references from
 * img[src|data-src|data-lazy-src], picture > source[srcset] and CSS
 * background-image declarations, plus every anchor link. All references
 * are resolved against page_url; links are not filtered by host.
 */
PageContent extract_page(const std::string& html, const std::string& page_url);

// URLs from a srcset value ("a.jpg 1x, b.jpg 2x"), descriptors dropped
std::vector<std::string> parse_srcset(const std::string& srcset);

// Raw url(...) values of background-image declarations
std::vector<std::string> find_css_background_urls(const std::string& text);

}  // namespace boxhunt::crawl
