#include <boxhunt/source/keyword_api_client.hpp>
#include <boxhunt/net/url.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace boxhunt::source {

using json = nlohmann::json;

namespace {

std::string string_field(const json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return "";
}

int int_field(const json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_number()) {
        return obj[key].get<int>();
    }
    return 0;
}

const json& object_field(const json& obj, const char* key) {
    static const json empty = json::object();
    if (obj.is_object() && obj.contains(key) && obj[key].is_object()) {
        return obj[key];
    }
    return empty;
}

Result<json> parse_body(const std::string& body, const char* provider) {
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        return Error(ErrorCode::CORRUPTION,
            std::string(provider) + " response is not valid JSON: " + e.what());
    }
}

}  // namespace

// ============================================================================
// Response mapping
// ============================================================================

Result<std::vector<Candidate>> parse_pexels_response(const std::string& body) {
    auto parsed = parse_body(body, "Pexels");
    if (!parsed.ok()) {
        return parsed.error();
    }
    const json& j = parsed.value();

    std::vector<Candidate> candidates;
    if (!j.is_object() || !j.contains("photos") || !j["photos"].is_array()) {
        return candidates;
    }

    for (const auto& photo : j["photos"]) {
        const json& src = object_field(photo, "src");
        Candidate c;
        c.url = string_field(src, "original");
        if (c.url.empty()) continue;
        c.thumbnail_url = string_field(src, "medium");
        c.title = string_field(photo, "alt");
        c.source = "pexels";
        c.width = int_field(photo, "width");
        c.height = int_field(photo, "height");
        candidates.push_back(std::move(c));
    }
    return candidates;
}

Result<std::vector<Candidate>> parse_unsplash_response(const std::string& body) {
    auto parsed = parse_body(body, "Unsplash");
    if (!parsed.ok()) {
        return parsed.error();
    }
    const json& j = parsed.value();

    std::vector<Candidate> candidates;
    if (!j.is_object() || !j.contains("results") || !j["results"].is_array()) {
        return candidates;
    }

    for (const auto& photo : j["results"]) {
        const json& urls = object_field(photo, "urls");
        Candidate c;
        c.url = string_field(urls, "regular");
        if (c.url.empty()) continue;
        c.thumbnail_url = string_field(urls, "thumb");
        c.title = string_field(photo, "description");
        if (c.title.empty()) {
            c.title = string_field(photo, "alt_description");
        }
        c.source = "unsplash";
        c.width = int_field(photo, "width");
        c.height = int_field(photo, "height");
        candidates.push_back(std::move(c));
    }
    return candidates;
}

// ============================================================================
// KeywordApiClient
// ============================================================================

KeywordApiClient::KeywordApiClient(KeywordApiConfig config, net::HttpClient* http, Logger* logger)
    : config_(std::move(config))
    , http_(http)
    , logger_(logger ? logger : null_logger()) {}

Result<std::vector<Candidate>> KeywordApiClient::search(const std::string& query, int limit) {
    if (!has_credentials()) {
        logger_->warning("[" + name() + "] API key not configured, skipping search");
        return std::vector<Candidate>{};
    }
    if (query.empty() || limit <= 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, name() + ": empty query or non-positive limit");
    }

    int page_size = std::min(limit, max_page_size());

    net::HttpRequest request;
    request.url = config_.endpoint + "?" + net::build_query(query_params(query, page_size));
    request.headers = auth_headers();
    request.user_agent = config_.user_agent;
    request.timeout_ms = config_.timeout_ms;

    auto response = http_->get(request);
    if (!response.ok()) {
        logger_->error("[" + name() + "] Request failed: " + response.error().to_string());
        return response.error();
    }
    if (response->status != 200) {
        Error err = net::status_error(response->status, name() + " search");
        logger_->error("[" + name() + "] " + err.to_string());
        return err;
    }

    auto candidates = parse(response->body);
    if (!candidates.ok()) {
        logger_->error("[" + name() + "] " + candidates.error().to_string());
        return candidates.error();
    }

    logger_->info("[" + name() + "] Found " + std::to_string(candidates->size()) +
                  " images for query: " + query);
    return candidates;
}

// ============================================================================
// Providers
// ============================================================================

KeywordApiClient::Params PexelsClient::query_params(const std::string& query, int page_size) const {
    return {
        {"query", query},
        {"per_page", std::to_string(page_size)},
        {"size", "medium"},
    };
}

KeywordApiClient::Headers PexelsClient::auth_headers() const {
    return {{"Authorization", config_.api_key}};
}

Result<std::vector<Candidate>> PexelsClient::parse(const std::string& body) const {
    return parse_pexels_response(body);
}

KeywordApiClient::Params UnsplashClient::query_params(const std::string& query, int page_size) const {
    return {
        {"query", query},
        {"per_page", std::to_string(page_size)},
    };
}

KeywordApiClient::Headers UnsplashClient::auth_headers() const {
    return {{"Authorization", "Client-ID " + config_.api_key}};
}

Result<std::vector<Candidate>> UnsplashClient::parse(const std::string& body) const {
    return parse_unsplash_response(body);
}

}  // namespace boxhunt::source
