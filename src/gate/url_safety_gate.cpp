/**
 * @file url_safety_gate.cpp
 * @brief Safety gate checks
 */

#include <gate/url_safety_gate.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace MineSpec {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<DenyReason> blocked_hostname(const std::string& host) {
    static const char* metadata_names[] = {
        "metadata", "metadata.google.internal", "metadata.google.com",
        "metadata.azure.com", "instance-data", "instance-data.ec2.internal"};
    for (const char* name : metadata_names) {
        if (host == name) return DenyReason::CloudMetadata;
    }
    if (host == "localhost" || ends_with(host, ".localhost") ||
        ends_with(host, ".internal") || ends_with(host, ".local")) {
        return DenyReason::PrivateIp;
    }
    return std::nullopt;
}

GateVerdict deny_logged(DenyReason reason, const std::string& url, std::string detail) {
    Logger::warn("URL denied (" + to_string(reason) + "): " + url + " - " + detail);
    return GateVerdict::deny(reason, std::move(detail));
}

} // namespace

std::string to_string(DenyReason reason) {
    switch (reason) {
        case DenyReason::InvalidUrl:       return "invalid_url";
        case DenyReason::DnsUnresolved:    return "dns_unresolved";
        case DenyReason::PrivateIp:        return "private_ip";
        case DenyReason::CloudMetadata:    return "cloud_metadata";
        case DenyReason::RobotsDisallowed: return "robots_disallowed";
    }
    return "invalid_url";
}

UrlSafetyGate::UrlSafetyGate(GateSettings settings,
                             std::shared_ptr<Resolver> resolver,
                             std::shared_ptr<RobotsCache> robots_cache,
                             std::shared_ptr<RobotsSource> robots_source)
    : settings_(std::move(settings)),
      resolver_(std::move(resolver)),
      robots_cache_(std::move(robots_cache)),
      robots_source_(std::move(robots_source)) {
    if (!resolver_) {
        throw std::invalid_argument("UrlSafetyGate requires a resolver");
    }
}

GateVerdict UrlSafetyGate::is_safe(std::string_view url, GatePolicy policy) const {
    std::string text(url);
    std::string error;
    auto parsed = parse_url(url, settings_.max_url_length, &error);
    if (!parsed) {
        return deny_logged(DenyReason::InvalidUrl, text.substr(0, 200), error);
    }

    GateVerdict address = check_address_policy(*parsed);
    if (!address.allowed) {
        Logger::warn("URL denied (" + to_string(*address.reason) + "): " + text + " - " + address.detail);
        return address;
    }

    if (settings_.respect_robots && !policy.override_robots) {
        GateVerdict robots = check_robots(*parsed);
        if (!robots.allowed) {
            Logger::warn("URL denied (" + to_string(*robots.reason) + "): " + text + " - " + robots.detail);
            return robots;
        }
    }

    Logger::debug("URL allowed: " + text);
    return GateVerdict::allow();
}

std::optional<std::string> UrlSafetyGate::sanitize(std::string_view text, GatePolicy policy) const {
    auto url = sanitize_url(text);
    if (!url || !is_safe(*url, policy).allowed) return std::nullopt;
    return url;
}

GateVerdict UrlSafetyGate::check_address_policy(const ParsedUrl& url) const {
    if (auto reason = blocked_hostname(url.host)) {
        return GateVerdict::deny(*reason, "blocked host name " + url.host);
    }

    std::vector<IpAddress> addresses;
    if (auto literal = IpAddress::parse(url.host)) {
        addresses.push_back(*literal);
    } else if (url.host_is_ipv6) {
        return GateVerdict::deny(DenyReason::InvalidUrl, "malformed IPv6 literal " + url.host);
    } else {
        addresses = resolver_->resolve(url.host);
        if (addresses.empty()) {
            return GateVerdict::deny(DenyReason::DnsUnresolved, "no addresses for " + url.host);
        }
    }

    // One blocked address is enough: the fetcher may connect to any of them.
    for (const auto& addr : addresses) {
        switch (classify_address(addr)) {
            case AddressClass::CloudMetadata:
                return GateVerdict::deny(DenyReason::CloudMetadata, url.host + " -> " + addr.to_string());
            case AddressClass::Private:
                return GateVerdict::deny(DenyReason::PrivateIp, url.host + " -> " + addr.to_string());
            case AddressClass::Public:
                break;
        }
    }
    return GateVerdict::allow();
}

GateVerdict UrlSafetyGate::check_robots(const ParsedUrl& url) const {
    if (!robots_cache_ || !robots_source_) return GateVerdict::allow();

    // Cached per host: http and https of one domain share the fetched rules.
    const std::string origin = url.origin();
    auto rules = robots_cache_->get(url.host);
    if (!rules) {
        auto body = robots_source_->fetch_robots(origin);
        if (body) {
            rules = RobotsRules::parse(*body, settings_.user_agent);
        } else {
            Logger::debug("robots.txt unavailable for " + origin + ", allowing");
            rules = RobotsRules::allow_all();
        }
        robots_cache_->put(url.host, *rules);
    }

    if (!rules->allows(url.path_and_query())) {
        return GateVerdict::deny(DenyReason::RobotsDisallowed, "robots.txt disallows " + url.path);
    }
    return GateVerdict::allow();
}

} // namespace MineSpec
