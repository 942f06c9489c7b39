#include <boxhunt/net/url.hpp>
#include <boxhunt/util/strings.hpp>

#include <cctype>
#include <cstdio>

namespace boxhunt::net {

namespace {

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

std::string default_port(const std::string& scheme) {
    if (scheme == "http") return "80";
    if (scheme == "https") return "443";
    return "";
}

// RFC 3986 section 5.2.4
std::string remove_dot_segments(const std::string& path) {
    std::string input = path;
    std::string output;

    while (!input.empty()) {
        if (util::starts_with(input, "../")) {
            input.erase(0, 3);
        } else if (util::starts_with(input, "./")) {
            input.erase(0, 2);
        } else if (util::starts_with(input, "/./")) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (util::starts_with(input, "/../") || input == "/..") {
            input = input.size() == 3 ? std::string("/") : input.substr(3);
            size_t last = output.rfind('/');
            output.erase(last == std::string::npos ? 0 : last);
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            size_t start = input[0] == '/' ? 1 : 0;
            size_t next = input.find('/', start);
            if (next == std::string::npos) {
                output += input;
                input.clear();
            } else {
                output += input.substr(0, next);
                input.erase(0, next);
            }
        }
    }
    return output;
}

std::string merge_paths(const Url& base, const std::string& ref_path) {
    if (base.has_authority && base.path.empty()) {
        return "/" + ref_path;
    }
    size_t last = base.path.rfind('/');
    if (last == std::string::npos) {
        return ref_path;
    }
    return base.path.substr(0, last + 1) + ref_path;
}

// Escapes characters browsers escape before sending (space, quotes, non-ASCII)
std::string escape_unsafe(const std::string& url) {
    std::string out;
    out.reserve(url.size());
    for (unsigned char c : url) {
        if (c <= 0x20 || c >= 0x7F || c == '"' || c == '<' || c == '>' ||
            c == '`' || c == '{' || c == '}' || c == '|' || c == '\\' || c == '^') {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

}  // namespace

std::string Url::netloc() const {
    if (port.empty() || port == default_port(scheme)) {
        return host;
    }
    return host + ":" + port;
}

std::string Url::to_string() const {
    std::string out;
    if (!scheme.empty()) {
        out += scheme + ":";
    }
    if (has_authority) {
        out += "//";
        if (!userinfo.empty()) out += userinfo + "@";
        out += host;
        if (!port.empty()) out += ":" + port;
    }
    out += path;
    if (has_query) out += "?" + query;
    if (has_fragment) out += "#" + fragment;
    return out;
}

std::optional<Url> parse_url(std::string_view text) {
    Url url;
    std::string rest(text);

    // Fragment
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        url.has_fragment = true;
        url.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }

    // Scheme: must precede any '/', '?'
    size_t colon = rest.find(':');
    if (colon != std::string::npos && colon > 0 &&
        std::isalpha(static_cast<unsigned char>(rest[0]))) {
        bool valid = true;
        for (size_t i = 0; i < colon; ++i) {
            if (!is_scheme_char(rest[i])) {
                valid = false;
                break;
            }
        }
        if (valid) {
            url.scheme = util::to_lower(rest.substr(0, colon));
            rest.erase(0, colon + 1);
        }
    }

    // Query
    size_t question = rest.find('?');
    if (question != std::string::npos) {
        url.has_query = true;
        url.query = rest.substr(question + 1);
        rest.erase(question);
    }

    // Authority
    if (util::starts_with(rest, "//")) {
        url.has_authority = true;
        size_t end = rest.find('/', 2);
        std::string authority = rest.substr(2, end == std::string::npos ? std::string::npos : end - 2);
        rest = end == std::string::npos ? std::string() : rest.substr(end);

        size_t at = authority.rfind('@');
        if (at != std::string::npos) {
            url.userinfo = authority.substr(0, at);
            authority.erase(0, at + 1);
        }

        std::string host_part = authority;
        if (!authority.empty() && authority[0] == '[') {
            size_t close = authority.find(']');
            if (close == std::string::npos) return std::nullopt;
            host_part = authority.substr(0, close + 1);
            if (close + 1 < authority.size()) {
                if (authority[close + 1] != ':') return std::nullopt;
                url.port = authority.substr(close + 2);
            }
        } else {
            size_t port_colon = authority.rfind(':');
            if (port_colon != std::string::npos) {
                host_part = authority.substr(0, port_colon);
                url.port = authority.substr(port_colon + 1);
            }
        }
        for (char c : url.port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        url.host = util::to_lower(host_part);
    }

    url.path = rest;
    return url;
}

std::optional<std::string> resolve_url(const std::string& base, const std::string& reference) {
    auto base_url = parse_url(base);
    auto ref = parse_url(reference);
    if (!base_url || !ref || !base_url->is_absolute()) {
        return std::nullopt;
    }

    Url target;
    if (ref->is_absolute()) {
        target = *ref;
        target.path = remove_dot_segments(ref->path);
    } else {
        target.scheme = base_url->scheme;
        if (ref->has_authority) {
            target.has_authority = true;
            target.userinfo = ref->userinfo;
            target.host = ref->host;
            target.port = ref->port;
            target.path = remove_dot_segments(ref->path);
            target.has_query = ref->has_query;
            target.query = ref->query;
        } else {
            target.has_authority = base_url->has_authority;
            target.userinfo = base_url->userinfo;
            target.host = base_url->host;
            target.port = base_url->port;
            if (ref->path.empty()) {
                target.path = base_url->path;
                target.has_query = ref->has_query || base_url->has_query;
                target.query = ref->has_query ? ref->query : base_url->query;
            } else {
                if (ref->path[0] == '/') {
                    target.path = remove_dot_segments(ref->path);
                } else {
                    target.path = remove_dot_segments(merge_paths(*base_url, ref->path));
                }
                target.has_query = ref->has_query;
                target.query = ref->query;
            }
        }
        target.has_fragment = ref->has_fragment;
        target.fragment = ref->fragment;
    }

    if (target.has_authority && target.path.empty()) {
        target.path = "/";
    }
    return target.to_string();
}

std::optional<std::string> normalize_link(const std::string& page_url, const std::string& reference) {
    std::string ref = util::trim(reference);
    if (ref.empty() || ref[0] == '#') {
        return std::nullopt;
    }

    std::string lower = util::to_lower(ref);
    if (util::starts_with(lower, "data:") || util::starts_with(lower, "javascript:") ||
        util::starts_with(lower, "mailto:") || util::starts_with(lower, "tel:")) {
        return std::nullopt;
    }

    auto resolved = resolve_url(page_url, ref);
    if (!resolved) {
        return std::nullopt;
    }

    auto url = parse_url(*resolved);
    if (!url || !url->is_http() || url->host.empty()) {
        return std::nullopt;
    }
    if (util::ends_with(util::to_lower(url->path), ".pdf")) {
        return std::nullopt;
    }

    url->has_fragment = false;
    url->fragment.clear();
    return escape_unsafe(url->to_string());
}

bool same_host(const std::string& a, const std::string& b) {
    auto ua = parse_url(a);
    auto ub = parse_url(b);
    if (!ua || !ub || ua->host.empty()) {
        return false;
    }
    return ua->netloc() == ub->netloc();
}

std::string collection_domain(const std::string& url) {
    auto parsed = parse_url(url);
    if (!parsed || parsed->host.empty()) {
        return "";
    }
    std::string host = parsed->host;
    if (util::starts_with(host, "www.")) {
        host.erase(0, 4);
    }
    return host;
}

std::string site_label(const std::string& url) {
    std::string host = collection_domain(url);
    size_t dot = host.find('.');
    return dot == std::string::npos ? host : host.substr(0, dot);
}

std::string url_encode(std::string_view value) {
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out += '&';
        out += url_encode(key) + "=" + url_encode(value);
    }
    return out;
}

}  // namespace boxhunt::net
