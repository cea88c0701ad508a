/**
 * @file url_safety_gate.hpp
 * @brief Fail-closed check every URL passes before any fetch
 */

#pragma once

#include <config/settings.hpp>
#include <gate/resolver.hpp>
#include <gate/robots_cache.hpp>
#include <gate/url.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace MineSpec {

enum class DenyReason {
    InvalidUrl,
    DnsUnresolved,
    PrivateIp,
    CloudMetadata,
    RobotsDisallowed // policy deny, not a security deny
};

std::string to_string(DenyReason reason);

struct GateVerdict {
    bool allowed = false;
    std::optional<DenyReason> reason;
    std::string detail;

    static GateVerdict allow() { return {true, std::nullopt, {}}; }
    static GateVerdict deny(DenyReason r, std::string detail) { return {false, r, std::move(detail)}; }

    bool is_security_deny() const {
        return !allowed && reason && *reason != DenyReason::RobotsDisallowed;
    }
};

struct GatePolicy {
    bool override_robots = false;
};

/**
 * @brief URL safety gate
 *
 * Order: syntax, blocked host names, DNS, every resolved address, then
 * robots.txt. Address verdicts are recomputed on every call; only robots
 * rules are cached.
 */
class UrlSafetyGate {
public:
    /**
     * @param robots_cache Optional; robots checking needs both cache and source
     * @param robots_source Optional; without it the robots step is skipped
     */
    UrlSafetyGate(GateSettings settings,
                  std::shared_ptr<Resolver> resolver,
                  std::shared_ptr<RobotsCache> robots_cache = nullptr,
                  std::shared_ptr<RobotsSource> robots_source = nullptr);

    GateVerdict is_safe(std::string_view url, GatePolicy policy = {}) const;

    /**
     * @brief sanitize_url followed by is_safe
     * @return The normalized URL, or nullopt when it is empty or denied
     */
    std::optional<std::string> sanitize(std::string_view text, GatePolicy policy = {}) const;

private:
    GateVerdict check_address_policy(const ParsedUrl& url) const;
    GateVerdict check_robots(const ParsedUrl& url) const;

    GateSettings settings_;
    std::shared_ptr<Resolver> resolver_;
    std::shared_ptr<RobotsCache> robots_cache_;
    std::shared_ptr<RobotsSource> robots_source_;
};

} // namespace MineSpec
