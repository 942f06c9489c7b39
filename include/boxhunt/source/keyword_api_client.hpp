#pragma once

#include <boxhunt/net/http_client.hpp>
#include <boxhunt/source/source_client.hpp>
#include <boxhunt/util/logger.hpp>

#include <string>
#include <utility>
#include <vector>

namespace boxhunt::source {

// ============================================================================
// Provider response mapping
// ============================================================================

/**
 * Maps a Pexels /v1/search body to candidates:
 * photos[].src.original -> url, src.medium -> thumbnail, alt -> title.
 *
 * Missing or mistyped fields become "" / 0; photos without a url are
 * dropped. A body that is not JSON is CORRUPTION.
 */
Result<std::vector<Candidate>> parse_pexels_response(const std::string& body);

/**
 * Maps an Unsplash /search/photos body to candidates:
 * results[].urls.regular -> url, urls.thumb -> thumbnail,
 * description (or alt_description) -> title.
 */
Result<std::vector<Candidate>> parse_unsplash_response(const std::string& body);

// ============================================================================
// Keyword API Client
// ============================================================================

struct KeywordApiConfig {
    std::string api_key;
    std::string endpoint;
    std::string user_agent;
    int timeout_ms = 30000;
};

/**
 * One authenticated GET per query. Subclasses describe the provider;
 * the request/response flow lives here.
 */
class KeywordApiClient : public SourceClient {
public:
    KeywordApiClient(KeywordApiConfig config, net::HttpClient* http, Logger* logger);

    SourceKind kind() const override { return SourceKind::KEYWORD_API; }

    Result<std::vector<Candidate>> search(const std::string& query, int limit) override;

    bool has_credentials() const { return !config_.api_key.empty(); }

    // Provider's documented page-size maximum
    virtual int max_page_size() const = 0;

protected:
    using Params = std::vector<std::pair<std::string, std::string>>;
    using Headers = std::vector<std::pair<std::string, std::string>>;

    virtual Params query_params(const std::string& query, int page_size) const = 0;
    virtual Headers auth_headers() const = 0;
    virtual Result<std::vector<Candidate>> parse(const std::string& body) const = 0;

    KeywordApiConfig config_;

private:
    net::HttpClient* http_;
    Logger* logger_;
};

class PexelsClient : public KeywordApiClient {
public:
    static constexpr int MAX_PAGE_SIZE = 80;

    using KeywordApiClient::KeywordApiClient;

    std::string name() const override { return "pexels"; }
    int max_page_size() const override { return MAX_PAGE_SIZE; }

protected:
    Params query_params(const std::string& query, int page_size) const override;
    Headers auth_headers() const override;
    Result<std::vector<Candidate>> parse(const std::string& body) const override;
};

class UnsplashClient : public KeywordApiClient {
public:
    static constexpr int MAX_PAGE_SIZE = 30;

    using KeywordApiClient::KeywordApiClient;

    std::string name() const override { return "unsplash"; }
    int max_page_size() const override { return MAX_PAGE_SIZE; }

protected:
    Params query_params(const std::string& query, int page_size) const override;
    Headers auth_headers() const override;
    Result<std::vector<Candidate>> parse(const std::string& body) const override;
};

}  // namespace boxhunt::source
