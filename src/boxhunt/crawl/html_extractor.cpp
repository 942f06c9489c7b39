#include <boxhunt/crawl/html_extractor.hpp>
#include <boxhunt/net/url.hpp>
#include <boxhunt/util/strings.hpp>

#include <gumbo.h>

#include <cstring>
#include <regex>
#include <unordered_set>

namespace boxhunt::crawl {

namespace {

const char* attribute(GumboNode* node, const char* name) {
    GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    if (attr && attr->value && attr->value[0] != '\0') {
        return attr->value;
    }
    return nullptr;
}

int int_attribute(GumboNode* node, const char* name) {
    const char* value = attribute(node, name);
    int out = 0;
    if (value && util::parse_leading_int(value, out)) {
        return out;
    }
    return 0;
}

// Older gumbo releases have no GUMBO_TAG_PICTURE and report <picture> as unknown
bool has_picture_parent(GumboNode* node) {
    GumboNode* parent = node->parent;
    if (!parent || parent->type != GUMBO_NODE_ELEMENT) return false;

    const GumboElement& element = parent->v.element;
    if (element.tag != GUMBO_TAG_UNKNOWN) {
        return std::strcmp(gumbo_normalized_tagname(element.tag), "picture") == 0;
    }
    GumboStringPiece name = element.original_tag;
    gumbo_tag_from_original_text(&name);
    return util::to_lower(std::string(name.data, name.length)) == "picture";
}

class PageCollector {
public:
    explicit PageCollector(const std::string& page_url) : page_url_(page_url) {}

    void add_image(const std::string& raw, const std::string& title, int width, int height) {
        auto url = net::normalize_link(page_url_, raw);
        if (!url || !looks_like_image_url(*url)) return;
        if (!seen_images_.insert(*url).second) return;

        ImageRef ref;
        ref.url = *url;
        ref.title = title;
        ref.width = width;
        ref.height = height;
        content_.images.push_back(std::move(ref));
    }

    void add_link(const std::string& raw) {
        auto url = net::normalize_link(page_url_, raw);
        if (!url) return;
        if (!seen_links_.insert(*url).second) return;
        content_.links.push_back(*url);
    }

    PageContent take() { return std::move(content_); }

private:
    std::string page_url_;
    PageContent content_;
    std::unordered_set<std::string> seen_images_;
    std::unordered_set<std::string> seen_links_;
};

void visit_element(GumboNode* node, PageCollector& collector) {
    switch (node->v.element.tag) {
        case GUMBO_TAG_IMG: {
            const char* src = attribute(node, "src");
            if (!src) src = attribute(node, "data-src");
            if (!src) src = attribute(node, "data-lazy-src");
            if (src) {
                const char* title = attribute(node, "alt");
                if (!title) title = attribute(node, "title");
                collector.add_image(src, title ? title : "",
                                    int_attribute(node, "width"),
                                    int_attribute(node, "height"));
            }
            break;
        }
        case GUMBO_TAG_SOURCE: {
            const char* srcset = attribute(node, "srcset");
            if (srcset && has_picture_parent(node)) {
                for (const auto& url : parse_srcset(srcset)) {
                    collector.add_image(url, "", 0, 0);
                }
            }
            break;
        }
        case GUMBO_TAG_A: {
            const char* href = attribute(node, "href");
            if (href) collector.add_link(href);
            break;
        }
        default:
            break;
    }

    const char* style = attribute(node, "style");
    if (style) {
        for (const auto& url : find_css_background_urls(style)) {
            collector.add_image(url, "", 0, 0);
        }
    }
}

}  // namespace

bool looks_like_image_url(const std::string& url) {
    auto parsed = net::parse_url(url);
    if (!parsed) return false;
    std::string path = util::to_lower(parsed->path);

    static const char* extensions[] = {".jpg", ".jpeg", ".png", ".gif", ".webp", ".bmp", ".svg"};
    for (const char* ext : extensions) {
        if (path.find(ext) != std::string::npos) return true;
    }

    static const char* indicators[] = {"image", "img", "photo", "picture", "pic"};
    for (const char* word : indicators) {
        if (path.find(word) != std::string::npos) return true;
    }
    return false;
}

std::vector<std::string> parse_srcset(const std::string& srcset) {
    std::vector<std::string> urls;
    for (const auto& part : util::split(srcset, ',')) {
        std::string candidate = util::trim(part);
        if (candidate.empty()) continue;
        size_t space = candidate.find_first_of(" \t\r\n");
        urls.push_back(space == std::string::npos ? candidate : candidate.substr(0, space));
    }
    return urls;
}

std::vector<std::string> find_css_background_urls(const std::string& text) {
    static const std::regex pattern(
        R"(background-image\s*:\s*url\(\s*["']?([^"'\)\s]+)["']?\s*\))",
        std::regex::icase);

    std::vector<std::string> urls;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        urls.push_back((*it)[1].str());
    }
    return urls;
}

PageContent extract_page(const std::string& html, const std::string& page_url) {
    PageCollector collector(page_url);

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (output) {
        // Depth-first walk; children pushed in reverse to keep document order
        std::vector<GumboNode*> stack;
        stack.push_back(output->root);

        while (!stack.empty()) {
            GumboNode* node = stack.back();
            stack.pop_back();

            if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
                continue;
            }

            visit_element(node, collector);

            GumboVector* children = &node->v.element.children;
            for (int i = static_cast<int>(children->length) - 1; i >= 0; --i) {
                stack.push_back(static_cast<GumboNode*>(children->data[i]));
            }
        }
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }

    // Stylesheets and anything gumbo keeps as raw text
    for (const auto& url : find_css_background_urls(html)) {
        collector.add_image(url, "", 0, 0);
    }

    return collector.take();
}

}  // namespace boxhunt::crawl
