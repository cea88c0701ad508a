/**
 * @file url.cpp
 * @brief URL parsing
 */

#include <gate/url.hpp>
#include <algorithm>
#include <cctype>

namespace MineSpec {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool fail(std::string* error, const char* message) {
    if (error) *error = message;
    return false;
}

bool valid_hostname(const std::string& host) {
    if (host.empty() || host.size() > 253) return false;
    size_t label = 0;
    for (size_t i = 0; i < host.size(); ++i) {
        char c = host[i];
        if (c == '.') {
            if (label == 0) return false;
            label = 0;
            continue;
        }
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')) return false;
        if (++label > 63) return false;
    }
    return true;
}

} // namespace

uint16_t ParsedUrl::effective_port() const {
    if (port) return *port;
    return scheme == "https" ? 443 : 80;
}

std::string ParsedUrl::origin() const {
    std::string out = scheme + "://";
    out += host_is_ipv6 ? "[" + host + "]" : host;
    if (port) out += ":" + std::to_string(*port);
    return out;
}

std::string ParsedUrl::path_and_query() const {
    return query.empty() ? path : path + "?" + query;
}

std::optional<ParsedUrl> parse_url(std::string_view url, size_t max_length, std::string* error) {
    if (url.empty()) {
        fail(error, "empty url");
        return std::nullopt;
    }
    if (url.size() > max_length) {
        fail(error, "url too long");
        return std::nullopt;
    }
    for (char c : url) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7f || c == '\\') {
            fail(error, "control character, space or backslash in url");
            return std::nullopt;
        }
    }

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        fail(error, "missing scheme");
        return std::nullopt;
    }

    ParsedUrl out;
    out.scheme = lower(url.substr(0, scheme_end));
    if (out.scheme != "http" && out.scheme != "https") {
        fail(error, "scheme must be http or https");
        return std::nullopt;
    }

    std::string_view rest = url.substr(scheme_end + 3);
    size_t auth_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, auth_end);
    std::string_view tail = auth_end == std::string_view::npos ? std::string_view{} : rest.substr(auth_end);

    if (authority.find('@') != std::string_view::npos) {
        fail(error, "userinfo is not allowed");
        return std::nullopt;
    }
    if (authority.empty()) {
        fail(error, "empty host");
        return std::nullopt;
    }

    std::string_view host_part;
    std::string_view port_part;
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos || close == 1) {
            fail(error, "malformed IPv6 literal");
            return std::nullopt;
        }
        host_part = authority.substr(1, close - 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                fail(error, "malformed IPv6 literal");
                return std::nullopt;
            }
            port_part = after.substr(1);
            if (port_part.empty()) {
                fail(error, "empty port");
                return std::nullopt;
            }
        }
        for (char c : host_part) {
            if (!(std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.')) {
                fail(error, "malformed IPv6 literal");
                return std::nullopt;
            }
        }
        out.host_is_ipv6 = true;
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host_part = authority.substr(0, colon);
            port_part = authority.substr(colon + 1);
            if (port_part.empty()) {
                fail(error, "empty port");
                return std::nullopt;
            }
        } else {
            host_part = authority;
        }
    }

    if (!port_part.empty()) {
        if (port_part.size() > 5 ||
            !std::all_of(port_part.begin(), port_part.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            fail(error, "invalid port");
            return std::nullopt;
        }
        unsigned long p = std::stoul(std::string(port_part));
        if (p == 0 || p > 65535) {
            fail(error, "port out of range");
            return std::nullopt;
        }
        out.port = static_cast<uint16_t>(p);
    }

    out.host = lower(host_part);
    if (!out.host_is_ipv6) {
        if (!out.host.empty() && out.host.back() == '.') out.host.pop_back();
        if (!valid_hostname(out.host)) {
            fail(error, "invalid host name");
            return std::nullopt;
        }
    }

    size_t hash = tail.find('#');
    if (hash != std::string_view::npos) tail = tail.substr(0, hash);
    size_t q = tail.find('?');
    std::string_view path = q == std::string_view::npos ? tail : tail.substr(0, q);
    out.path = path.empty() ? "/" : std::string(path);
    if (out.path.front() != '/') out.path.insert(out.path.begin(), '/');
    if (q != std::string_view::npos) out.query = std::string(tail.substr(q + 1));

    return out;
}

std::optional<std::string> sanitize_url(std::string_view text) {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
    if (b == e) return std::nullopt;

    std::string url(text.substr(b, e - b));
    if (url.find("://") == std::string::npos) {
        if (url.rfind("//", 0) == 0) url.erase(0, 2);
        url = "https://" + url;
    }
    return url;
}

std::string url_domain(std::string_view url) {
    auto parsed = parse_url(url, 8192);
    return parsed ? parsed->host : std::string{};
}

} // namespace MineSpec
