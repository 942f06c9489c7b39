#include <boxhunt/net/http_client.hpp>
#include <boxhunt/util/strings.hpp>

#include <curl/curl.h>

#include <cstdlib>
#include <mutex>

namespace boxhunt::net {

namespace {

struct TransferState {
    TransferState(HttpResponse* r, uint64_t max_bytes)
        : response(r), max_body_bytes(max_bytes), headers(r, max_bytes) {}

    HttpResponse* response;
    uint64_t max_body_bytes;
    HeaderCollector headers;
    bool too_large = false;
};

size_t body_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t total_size = size * nmemb;

    if (state->max_body_bytes > 0 &&
        state->response->body.size() + total_size > state->max_body_bytes) {
        state->too_large = true;
        return 0;  // Abort transfer
    }
    state->response->body.append(ptr, total_size);
    return total_size;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t total_size = size * nitems;
    if (!state->headers.feed(std::string(buffer, total_size))) {
        state->too_large = true;
        return 0;  // Abort before the body is transferred
    }
    return total_size;
}

void init_curl_global() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

}  // namespace

bool HeaderCollector::feed(const std::string& line) {
    if (util::starts_with(line, "HTTP/")) {
        response_->headers.clear();
        block_status_ = 0;
        size_t space = line.find(' ');
        if (space != std::string::npos) {
            block_status_ = std::strtol(line.c_str() + space + 1, nullptr, 10);
        }
        return true;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return true;
    }

    std::string name = util::to_lower(util::trim(line.substr(0, colon)));
    std::string value = util::trim(line.substr(colon + 1));
    response_->headers[name] = value;

    const bool redirect = block_status_ >= 300 && block_status_ < 400;
    if (name == "content-length" && max_body_bytes_ > 0 && !redirect) {
        char* end = nullptr;
        unsigned long long declared = std::strtoull(value.c_str(), &end, 10);
        if (end != value.c_str() && declared > max_body_bytes_) {
            return false;
        }
    }
    return true;
}

int64_t HttpResponse::content_length() const {
    std::string value = header("content-length");
    if (value.empty()) return -1;
    char* end = nullptr;
    long long n = std::strtoll(value.c_str(), &end, 10);
    if (end == value.c_str() || n < 0) return -1;
    return static_cast<int64_t>(n);
}

CurlHttpClient::CurlHttpClient() {
    init_curl_global();
}

Result<HttpResponse> CurlHttpClient::get(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to initialize CURL");
    }

    HttpResponse response;
    TransferState state(&response, request.max_body_bytes);

    struct curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, body_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, max_redirects_);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    if (!request.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, request.user_agent.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    char* effective = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective);
    if (effective) {
        response.effective_url = effective;
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (state.too_large) {
        return Error(ErrorCode::PAYLOAD_TOO_LARGE,
            request.url + " exceeds " + std::to_string(request.max_body_bytes) + " bytes");
    }
    if (res != CURLE_OK) {
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return Error(ErrorCode::TIMEOUT, "Request timed out: " + request.url);
        }
        return Error(ErrorCode::NETWORK_ERROR,
            request.url + ": " + curl_easy_strerror(res));
    }

    response.status = http_code;
    return response;
}

Error status_error(long status, const std::string& context) {
    std::string message = context + " returned HTTP " + std::to_string(status);
    switch (status) {
        case 401:
        case 403:
            return Error(ErrorCode::AUTH_ERROR, message);
        case 404:
            return Error(ErrorCode::NOT_FOUND, message);
        case 429:
            return Error(ErrorCode::RATE_LIMITED, message);
        default:
            return Error(ErrorCode::HTTP_ERROR, message);
    }
}

}  // namespace boxhunt::net
