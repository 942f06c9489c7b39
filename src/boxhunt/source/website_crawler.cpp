#include <boxhunt/source/website_crawler.hpp>
#include <boxhunt/crawl/charset.hpp>
#include <boxhunt/crawl/html_extractor.hpp>
#include <boxhunt/net/url.hpp>
#include <boxhunt/util/strings.hpp>

#include <chrono>
#include <deque>
#include <thread>
#include <unordered_set>

namespace boxhunt::source {

WebsiteCrawlerConfig WebsiteCrawlerConfig::from(const HarvestConfig& config) {
    WebsiteCrawlerConfig c;
    c.max_depth = config.max_depth;
    c.respect_robots = config.respect_robots;
    c.request_delay_ms = config.request_delay_ms;
    c.page_timeout_ms = config.page_timeout_ms;
    c.robots_timeout_ms = config.robots_timeout_ms;
    c.user_agent = config.user_agent;
    return c;
}

WebsiteCrawler::WebsiteCrawler(WebsiteCrawlerConfig config, net::HttpClient* http, Logger* logger)
    : config_(std::move(config))
    , http_(http)
    , logger_(logger ? logger : null_logger())
    , robots_(std::make_unique<crawl::RobotsCache>(
          http, config_.user_agent, config_.robots_timeout_ms, logger)) {}

Result<std::vector<Candidate>> WebsiteCrawler::search(const std::string& query, int limit) {
    return crawl(query, limit);
}

void WebsiteCrawler::pause() {
    if (config_.request_delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.request_delay_ms));
    }
}

Result<WebsiteCrawler::FetchedPage> WebsiteCrawler::fetch_page(const std::string& url) {
    net::HttpRequest request;
    request.url = url;
    request.user_agent = config_.user_agent;
    request.timeout_ms = config_.page_timeout_ms;
    request.max_body_bytes = config_.max_page_bytes;

    auto response = http_->get(request);
    if (!response.ok()) {
        return response.error();
    }
    if (!response->is_success()) {
        return net::status_error(response->status, url);
    }

    std::string content_type = response->content_type();
    if (!content_type.empty() && util::to_lower(content_type).find("html") == std::string::npos) {
        return Error(ErrorCode::UNSUPPORTED_FORMAT, url + " is not HTML (" + content_type + ")");
    }

    FetchedPage page;
    page.url = response->effective_url.empty() ? url : response->effective_url;
    page.html = crawl::decode_html(response->body, content_type);
    return page;
}

Result<std::vector<Candidate>> WebsiteCrawler::crawl(const std::string& seed_url, int max_images) {
    report_ = CrawlReport{};
    report_.seed = seed_url;

    auto seed = net::parse_url(util::trim(seed_url));
    if (!seed || !seed->is_http() || seed->host.empty()) {
        logger_->error("[WebsiteCrawler] Invalid URL: " + seed_url);
        return Error(ErrorCode::INVALID_ARGUMENT, "Invalid seed URL: " + seed_url);
    }
    if (max_images <= 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "max_images must be positive");
    }

    seed->has_fragment = false;
    seed->fragment.clear();
    if (seed->path.empty()) seed->path = "/";
    const std::string start = seed->to_string();

    logger_->info("[WebsiteCrawler] Starting website crawl: " + start);

    if (config_.respect_robots && !robots_->is_allowed(start)) {
        logger_->warning("[WebsiteCrawler] robots.txt disallows crawling: " + start);
        return Error(ErrorCode::ROBOTS_DISALLOWED, start);
    }

    std::string source_tag = net::site_label(start);
    if (source_tag.empty()) source_tag = "website";

    std::vector<Candidate> results;
    std::unordered_set<std::string> visited;
    std::unordered_set<std::string> seen_urls;
    std::deque<std::pair<std::string, int>> frontier;
    frontier.emplace_back(start, 0);
    bool fetched_before = false;

    const size_t target = static_cast<size_t>(max_images);

    while (!frontier.empty() && results.size() < target) {
        auto [url, depth] = frontier.front();
        frontier.pop_front();

        if (visited.count(url) > 0 || depth > config_.max_depth) {
            continue;
        }
        visited.insert(url);

        PageVisit visit;
        visit.url = url;
        visit.depth = depth;

        if (config_.respect_robots && depth > 0 && !robots_->is_allowed(url)) {
            logger_->info("[WebsiteCrawler] robots.txt disallows " + url);
            visit.status = PageStatus::ROBOTS_BLOCKED;
            report_.pages.push_back(visit);
            continue;
        }

        logger_->debug("[WebsiteCrawler] #URLs: " + std::to_string(frontier.size()) +
                       ", #Images: " + std::to_string(results.size()));

        if (fetched_before) pause();
        fetched_before = true;

        auto page = fetch_page(url);
        if (!page.ok()) {
            logger_->warning("[WebsiteCrawler] Failed to fetch " + url + ": " +
                             page.error().to_string());
            visit.status = PageStatus::FAILED;
            report_.pages.push_back(visit);
            continue;
        }

        crawl::PageContent content = crawl::extract_page(page->html, page->url);
        visit.images_found = content.images.size();

        for (auto& image : content.images) {
            if (!seen_urls.insert(image.url).second) continue;
            Candidate c;
            c.url = image.url;
            c.thumbnail_url = image.url;
            c.title = std::move(image.title);
            c.source = source_tag;
            c.width = image.width;
            c.height = image.height;
            results.push_back(std::move(c));
            ++visit.images_new;
        }

        logger_->info("[WebsiteCrawler] Found " + std::to_string(visit.images_new) + "/" +
                      std::to_string(visit.images_found) + " new images on " + url);
        report_.pages.push_back(visit);

        if (results.size() < target && depth < config_.max_depth) {
            for (const auto& link : content.links) {
                if (visited.count(link) > 0) continue;
                if (!net::same_host(link, start)) continue;
                frontier.emplace_back(link, depth + 1);
            }
        }
    }

    if (results.size() > target) {
        results.resize(target);
    }
    report_.images = results.size();

    logger_->info("[WebsiteCrawler] Website crawl completed: " + std::to_string(results.size()) +
                  " images found from " + start);
    return results;
}

}  // namespace boxhunt::source
