#pragma once

#include <boxhunt/config.hpp>
#include <boxhunt/crawl/robots.hpp>
#include <boxhunt/net/http_client.hpp>
#include <boxhunt/source/source_client.hpp>
#include <boxhunt/util/logger.hpp>

#include <memory>
#include <string>
#include <vector>

namespace boxhunt::source {

struct WebsiteCrawlerConfig {
    int max_depth = 2;
    bool respect_robots = true;
    int request_delay_ms = 1000;      // Pause between page fetches
    int page_timeout_ms = 30000;
    int robots_timeout_ms = 5000;
    uint64_t max_page_bytes = 5ull * 1024 * 1024;
    std::string user_agent = DEFAULT_USER_AGENT;

    static WebsiteCrawlerConfig from(const HarvestConfig& config);
};

enum class PageStatus {
    FETCHED,
    FAILED,          // Transport error or non-2xx status
    ROBOTS_BLOCKED
};

struct PageVisit {
    std::string url;
    int depth = 0;
    PageStatus status = PageStatus::FETCHED;
    size_t images_found = 0;   // References on the page
    size_t images_new = 0;     // Of those, not seen earlier in this crawl
};

/**
 * What one crawl() call did, in visitation order.
 */
struct CrawlReport {
    std::string seed;
    std::vector<PageVisit> pages;
    size_t images = 0;
};

/**
 * Breadth-first image discovery on a single site.
 *
 * The frontier is a FIFO of (url, depth) pairs starting at (seed, 0).
 * Each URL is processed at most once per crawl, nothing deeper than
 * max_depth is fetched, and only links on the seed's host are followed.
 * Images are unique by URL within one crawl; the result holds at most
 * max_images candidates.
 */
class WebsiteCrawler : public SourceClient {
public:
    WebsiteCrawler(WebsiteCrawlerConfig config, net::HttpClient* http, Logger* logger = nullptr);

    std::string name() const override { return "website"; }
    SourceKind kind() const override { return SourceKind::WEBSITE; }

    // query is the seed URL
    Result<std::vector<Candidate>> search(const std::string& query, int limit) override;

    /**
     * Crawl from a seed URL.
     *
     * @param seed_url Absolute http(s) URL
     * @param max_images Stop once this many unique image URLs are known
     * @return Candidates in discovery order; INVALID_ARGUMENT for a bad
     *         seed, ROBOTS_DISALLOWED when robots.txt forbids the seed
     */
    Result<std::vector<Candidate>> crawl(const std::string& seed_url, int max_images);

    const CrawlReport& last_report() const { return report_; }
    const WebsiteCrawlerConfig& config() const { return config_; }

private:
    struct FetchedPage {
        std::string url;      // After redirects
        std::string html;     // UTF-8
    };

    Result<FetchedPage> fetch_page(const std::string& url);
    void pause();

    WebsiteCrawlerConfig config_;
    net::HttpClient* http_;
    Logger* logger_;
    std::unique_ptr<crawl::RobotsCache> robots_;
    CrawlReport report_;
};

}  // namespace boxhunt::source
