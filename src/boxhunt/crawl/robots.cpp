#include <boxhunt/crawl/robots.hpp>
#include <boxhunt/net/url.hpp>
#include <boxhunt/util/strings.hpp>

#include <sstream>

namespace boxhunt::crawl {

std::string product_token(const std::string& user_agent) {
    std::string token;
    for (char c : user_agent) {
        if (c == '/' || c == ' ' || c == '(') break;
        token += c;
    }
    return util::to_lower(token);
}

// ============================================================================
// RobotsRules
// ============================================================================

RobotsRules RobotsRules::parse(const std::string& body, const std::string& user_agent) {
    const std::string own_token = product_token(user_agent);

    std::vector<Rule> specific;
    std::vector<Rule> wildcard;
    bool group_is_ours = false;
    bool group_is_wildcard = false;
    bool in_agent_lines = false;

    std::istringstream iss(body);
    std::string line;
    while (std::getline(iss, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = util::trim(line);
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = util::to_lower(util::trim(line.substr(0, colon)));
        std::string value = util::trim(line.substr(colon + 1));

        if (key == "user-agent") {
            // Consecutive user-agent lines share one group
            if (!in_agent_lines) {
                group_is_ours = false;
                group_is_wildcard = false;
            }
            in_agent_lines = true;
            std::string agent = util::to_lower(value);
            if (agent == "*") {
                group_is_wildcard = true;
            } else if (!own_token.empty() && product_token(agent) == own_token) {
                group_is_ours = true;
            }
            continue;
        }

        in_agent_lines = false;
        if (key != "allow" && key != "disallow") continue;
        if (value.empty()) continue;  // "Disallow:" with no path restricts nothing

        Rule rule;
        rule.pattern = value;
        rule.allow = key == "allow";
        if (group_is_ours) specific.push_back(rule);
        if (group_is_wildcard) wildcard.push_back(rule);
    }

    RobotsRules rules;
    rules.rules_ = !specific.empty() ? std::move(specific) : std::move(wildcard);
    return rules;
}

bool RobotsRules::pattern_matches(const std::string& pattern, const std::string& path) {
    bool anchored = !pattern.empty() && pattern.back() == '$';
    std::string pat = anchored ? pattern.substr(0, pattern.size() - 1) : pattern;

    // Greedy wildcard match with backtracking
    size_t p = 0;
    size_t s = 0;
    size_t star = std::string::npos;
    size_t star_s = 0;
    while (s < path.size()) {
        if (p < pat.size() && pat[p] == '*') {
            star = p++;
            star_s = s;
        } else if (p < pat.size() && pat[p] == path[s]) {
            ++p;
            ++s;
        } else if (p == pat.size() && !anchored) {
            return true;  // Prefix match
        } else if (star != std::string::npos) {
            p = star + 1;
            s = ++star_s;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

bool RobotsRules::is_allowed(const std::string& path_and_query) const {
    std::string path = path_and_query.empty() ? "/" : path_and_query;
    if (path == "/robots.txt") return true;

    size_t best_len = 0;
    bool best_allow = true;
    bool matched = false;
    for (const auto& rule : rules_) {
        if (!pattern_matches(rule.pattern, path)) continue;
        size_t len = rule.pattern.size();
        if (!matched || len > best_len || (len == best_len && rule.allow)) {
            best_len = len;
            best_allow = rule.allow;
            matched = true;
        }
    }
    return best_allow;
}

// ============================================================================
// RobotsCache
// ============================================================================

RobotsCache::RobotsCache(net::HttpClient* http, std::string user_agent, int timeout_ms,
                         Logger* logger)
    : http_(http)
    , user_agent_(std::move(user_agent))
    , timeout_ms_(timeout_ms)
    , logger_(logger ? logger : null_logger()) {}

std::shared_ptr<const RobotsRules> RobotsCache::rules_for(const std::string& origin) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(origin);
        if (it != cache_.end()) return it->second;
    }

    net::HttpRequest request;
    request.url = origin + "/robots.txt";
    request.user_agent = user_agent_;
    request.timeout_ms = timeout_ms_;
    request.max_body_bytes = 512 * 1024;

    RobotsRules rules;
    auto response = http_->get(request);
    if (!response.ok()) {
        logger_->debug("[Robots] " + request.url + " unavailable (" +
                       response.error().to_string() + "), allowing all");
    } else if (!response->is_success()) {
        logger_->debug("[Robots] " + request.url + " returned HTTP " +
                       std::to_string(response->status) + ", allowing all");
    } else {
        rules = RobotsRules::parse(response->body, user_agent_);
        logger_->debug("[Robots] Loaded " + std::to_string(rules.rule_count()) +
                       " rule(s) from " + request.url);
    }

    auto shared = std::make_shared<const RobotsRules>(std::move(rules));
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = cache_.emplace(origin, shared);
    return inserted.first->second;
}

bool RobotsCache::is_allowed(const std::string& url) {
    auto parsed = net::parse_url(url);
    if (!parsed || !parsed->is_http() || parsed->host.empty()) {
        return false;
    }

    std::string origin = parsed->scheme + "://" + parsed->netloc();
    std::string path = parsed->path.empty() ? "/" : parsed->path;
    if (parsed->has_query) {
        path += "?" + parsed->query;
    }
    return rules_for(origin)->is_allowed(path);
}

size_t RobotsCache::cached_hosts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void RobotsCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

}  // namespace boxhunt::crawl
