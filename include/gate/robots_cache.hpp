/**
 * @file robots_cache.hpp
 * @brief robots.txt rules and their per-origin TTL cache
 */

#pragma once

#include <utils/time.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace MineSpec {

/**
 * @brief Allow/Disallow rules that apply to one user agent
 *
 * Longest matching pattern wins; Allow wins a tie. Patterns support '*'
 * and a trailing '$'.
 */
class RobotsRules {
public:
    struct Rule {
        std::string pattern;
        bool allow = false;
    };

    static RobotsRules allow_all() { return RobotsRules{}; }

    /**
     * @param user_agent Full agent string; its product token ("Foo" in "Foo/1.0")
     *        selects the group, falling back to '*'
     */
    static RobotsRules parse(std::string_view body, const std::string& user_agent);

    bool allows(std::string_view path) const;

    const std::vector<Rule>& rules() const { return rules_; }

private:
    std::vector<Rule> rules_;
};

/**
 * @brief Fetches robots.txt for an origin; the pipeline's HTTP client implements it
 */
class RobotsSource {
public:
    virtual ~RobotsSource() = default;

    /**
     * @return Body text, or nullopt when the fetch failed
     */
    virtual std::optional<std::string> fetch_robots(const std::string& origin) = 0;
};

/**
 * @brief robots.txt rules keyed by host, expiring after a TTL
 *
 * Many readers, one writer. The clock is injected so tests control expiry.
 */
class RobotsCache {
public:
    RobotsCache(const Clock& clock, std::chrono::seconds ttl);

    /**
     * @return Rules for the host, or nullopt when absent or expired
     */
    std::optional<RobotsRules> get(const std::string& host) const;

    void put(const std::string& host, RobotsRules rules);

    /**
     * @brief Drop expired entries
     * @return Number of entries removed
     */
    size_t expire();

    size_t size() const;

private:
    struct Entry {
        RobotsRules rules;
        Clock::TimePoint expires_at;
    };

    const Clock& clock_;
    std::chrono::seconds ttl_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> entries_;
};

} // namespace MineSpec
