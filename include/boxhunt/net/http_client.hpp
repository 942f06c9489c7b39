#pragma once

#include <boxhunt/result.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace boxhunt::net {

// ============================================================================
// Request / Response
// ============================================================================

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string user_agent;
    int timeout_ms = 30000;
    uint64_t max_body_bytes = 0;  // 0 = unlimited
};

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;  // Names lower-cased
    std::string body;
    std::string effective_url;                   // After redirects

    bool is_success() const { return status >= 200 && status < 300; }

    std::string header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string() : it->second;
    }

    std::string content_type() const { return header("content-type"); }

    // Declared Content-Length, or -1 when absent or unparsable
    int64_t content_length() const;
};

/**
 * Collects response headers line by line as libcurl delivers them. Every
 * status line opens a new block, so after a redirect chain only the final
 * response's headers remain. The Content-Length cap is checked against
 * final responses only; a 3xx block's length describes its own body.
 */
class HeaderCollector {
public:
    HeaderCollector(HttpResponse* response, uint64_t max_body_bytes)
        : response_(response), max_body_bytes_(max_body_bytes) {}

    // false once a final response declares more than the cap
    bool feed(const std::string& line);

    long block_status() const { return block_status_; }

private:
    HttpResponse* response_;
    uint64_t max_body_bytes_;
    long block_status_ = 0;
};

// ============================================================================
// Client interface
// ============================================================================

/**
 * Blocking HTTP GET. Implementations must allow concurrent calls from
 * several threads.
 *
 * Transport problems are errors (TIMEOUT, NETWORK_ERROR, PAYLOAD_TOO_LARGE).
 * Any HTTP status, including 4xx/5xx, is a successful result; callers
 * decide what a status means.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpResponse> get(const HttpRequest& request) = 0;
};

using HttpClientPtr = std::unique_ptr<HttpClient>;

/**
 * libcurl implementation. Uses one easy handle per request.
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();

    Result<HttpResponse> get(const HttpRequest& request) override;

    void set_max_redirects(long n) { max_redirects_ = n; }

private:
    long max_redirects_ = 5;
};

/**
 * Maps a non-success status to an error code:
 * 401/403 -> AUTH_ERROR, 404 -> NOT_FOUND, 429 -> RATE_LIMITED,
 * anything else -> HTTP_ERROR.
 */
Error status_error(long status, const std::string& context);

}  // namespace boxhunt::net
