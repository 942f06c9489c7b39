#pragma once

#include <boxhunt/net/http_client.hpp>
#include <boxhunt/util/logger.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace boxhunt::crawl {

/**
 * Rules from one robots.txt that apply to a given crawler.
 *
 * Groups naming the crawler's product token win over "*" groups. Within
 * the applicable rules the longest matching pattern decides; a tie
 * between Allow and Disallow allows. Patterns support '*' and a
 * trailing '$'.
 */
class RobotsRules {
public:
    // Rules that allow everything
    RobotsRules() = default;

    static RobotsRules parse(const std::string& body, const std::string& user_agent);

    // path_and_query: "/a/b?x=1"
    bool is_allowed(const std::string& path_and_query) const;

    size_t rule_count() const { return rules_.size(); }

private:
    struct Rule {
        std::string pattern;
        bool allow = false;
    };

    static bool pattern_matches(const std::string& pattern, const std::string& path);

    std::vector<Rule> rules_;
};

// "BoxHunt/1.0 (Research)" -> "boxhunt"
std::string product_token(const std::string& user_agent);

/**
 * Per-host robots.txt cache. Each host's file is fetched once, lazily.
 * A 2xx body is parsed; any other status or a transport failure counts
 * as "no robots.txt" and allows everything.
 */
class RobotsCache {
public:
    RobotsCache(net::HttpClient* http, std::string user_agent, int timeout_ms,
                Logger* logger = nullptr);

    bool is_allowed(const std::string& url);

    size_t cached_hosts() const;
    void clear();

private:
    std::shared_ptr<const RobotsRules> rules_for(const std::string& scheme_and_host);

    net::HttpClient* http_;
    std::string user_agent_;
    int timeout_ms_;
    Logger* logger_;

    std::map<std::string, std::shared_ptr<const RobotsRules>> cache_;
    mutable std::mutex mutex_;
};

}  // namespace boxhunt::crawl
