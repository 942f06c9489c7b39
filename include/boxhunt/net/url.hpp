#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace boxhunt::net {

/**
 * URI reference split into RFC 3986 components.
 * The has_* flags distinguish "absent" from "present but empty".
 */
struct Url {
    std::string scheme;     // Lower-cased
    std::string userinfo;
    std::string host;       // Lower-cased
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;

    bool has_authority = false;
    bool has_query = false;
    bool has_fragment = false;

    bool is_absolute() const { return !scheme.empty(); }
    bool is_http() const { return scheme == "http" || scheme == "https"; }

    // host[:port], with the port omitted when it is the scheme default
    std::string netloc() const;

    std::string to_string() const;
};

/**
 * Parses an absolute URL or a relative reference.
 * Returns nullopt only for malformed authorities (e.g. a bad port).
 */
std::optional<Url> parse_url(std::string_view text);

/**
 * Resolves a reference against an absolute base (RFC 3986 section 5.2).
 * Returns nullopt if the base is not absolute or either part is malformed.
 */
std::optional<std::string> resolve_url(const std::string& base, const std::string& reference);

/**
 * Turns an attribute value found on page_url into a crawlable absolute
 * http(s) URL: trims, rejects data:/javascript:/mailto: refs and .pdf
 * targets, resolves, drops the fragment and escapes unsafe characters.
 */
std::optional<std::string> normalize_link(const std::string& page_url, const std::string& reference);

// Hosts (and effective ports) match, case-insensitively
bool same_host(const std::string& a, const std::string& b);

/**
 * Short site label used as a source tag: "https://www.Example.co.uk:8080/x"
 * -> "example". Empty if the URL has no host.
 */
std::string site_label(const std::string& url);

/**
 * Collection directory name for a site: lower-cased host without a
 * leading "www." or port. "https://www.Shop.com:8443/a" -> "shop.com".
 */
std::string collection_domain(const std::string& url);

// Percent-encodes everything except RFC 3986 unreserved characters
std::string url_encode(std::string_view value);

// "a=1&b=two%20words"
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

}  // namespace boxhunt::net
