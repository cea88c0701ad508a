/**
 * @file url.hpp
 * @brief Strict http(s) URL parsing for the safety gate
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace MineSpec {

struct ParsedUrl {
    std::string scheme;       // "http" or "https"
    std::string host;         // lowercase, brackets stripped for IPv6
    std::optional<uint16_t> port;
    std::string path;         // always starts with '/'
    std::string query;        // without '?'
    bool host_is_ipv6 = false;

    uint16_t effective_port() const;

    /**
     * @brief scheme://host[:port], the robots.txt cache key
     */
    std::string origin() const;

    /**
     * @brief Path plus "?query" when present
     */
    std::string path_and_query() const;
};

/**
 * @brief Parse an absolute http/https URL
 *
 * Rejects control characters and spaces, userinfo, empty hosts, malformed
 * IPv6 literals and bad ports. Fragments are dropped.
 *
 * @param error Set to a short description on failure when non-null
 */
MINESPEC_API std::optional<ParsedUrl> parse_url(std::string_view url, size_t max_length,
                                                std::string* error = nullptr);

/**
 * @brief Trim and add "https://" to scheme-less input
 * @return nullopt for blank input
 */
MINESPEC_API std::optional<std::string> sanitize_url(std::string_view text);

/**
 * @brief Lowercase host of a URL, empty when unparseable
 */
std::string url_domain(std::string_view url);

} // namespace MineSpec
