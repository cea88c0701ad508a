/**
 * @file robots_cache.cpp
 * @brief robots.txt parsing and cache
 */

#include <gate/robots_cache.hpp>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace MineSpec {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Iterative wildcard match. The pattern is a prefix match unless it ends in '$'.
bool pattern_matches(std::string_view pattern, std::string_view path) {
    bool anchored = !pattern.empty() && pattern.back() == '$';
    if (anchored) pattern.remove_suffix(1);

    size_t p = 0;
    size_t s = 0;
    size_t star = std::string_view::npos;
    size_t mark = 0;

    while (s < path.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = s;
        } else if (p < pattern.size() && pattern[p] == path[s]) {
            ++p;
            ++s;
        } else if (p == pattern.size() && !anchored) {
            return true;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            s = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

} // namespace

RobotsRules RobotsRules::parse(std::string_view body, const std::string& user_agent) {
    std::string token = lower(user_agent.substr(0, user_agent.find('/')));

    std::vector<Rule> specific;
    std::vector<Rule> wildcard;

    std::vector<std::string> agents;
    bool in_rules = false;
    bool group_specific = false;
    bool group_wildcard = false;

    size_t pos = 0;
    while (pos <= body.size()) {
        size_t end = body.find('\n', pos);
        if (end == std::string_view::npos) end = body.size();
        std::string_view line = body.substr(pos, end - pos);
        pos = end + 1;

        size_t hash = line.find('#');
        if (hash != std::string_view::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        std::string key = lower(trim(line.substr(0, colon)));
        std::string_view value = trim(line.substr(colon + 1));

        if (key == "user-agent") {
            if (in_rules) {
                agents.clear();
                group_specific = false;
                group_wildcard = false;
                in_rules = false;
            }
            std::string agent = lower(value);
            agents.push_back(agent);
            if (agent == "*") group_wildcard = true;
            else if (!token.empty() && agent == token) group_specific = true;
        } else if (key == "allow" || key == "disallow") {
            in_rules = true;
            if (agents.empty()) continue;
            // An empty Disallow allows everything and adds no rule.
            if (value.empty()) continue;
            Rule rule{std::string(value), key == "allow"};
            if (group_specific) specific.push_back(rule);
            if (group_wildcard) wildcard.push_back(rule);
        } else {
            // Sitemap, crawl-delay and unknown keys end nothing and add nothing.
            continue;
        }
    }

    RobotsRules out;
    out.rules_ = !specific.empty() ? std::move(specific) : std::move(wildcard);
    return out;
}

bool RobotsRules::allows(std::string_view path) const {
    size_t best_len = 0;
    bool best_allow = true;
    bool matched = false;

    for (const auto& rule : rules_) {
        if (!pattern_matches(rule.pattern, path)) continue;
        size_t len = rule.pattern.size();
        if (!matched || len > best_len || (len == best_len && rule.allow && !best_allow)) {
            best_len = len;
            best_allow = rule.allow;
            matched = true;
        }
    }
    return !matched || best_allow;
}

RobotsCache::RobotsCache(const Clock& clock, std::chrono::seconds ttl)
    : clock_(clock), ttl_(ttl) {}

std::optional<RobotsRules> RobotsCache::get(const std::string& host) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(host);
    if (it == entries_.end()) return std::nullopt;
    if (clock_.now() >= it->second.expires_at) return std::nullopt;
    return it->second.rules;
}

void RobotsCache::put(const std::string& host, RobotsRules rules) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[host] = Entry{std::move(rules), clock_.now() + ttl_};
}

size_t RobotsCache::expire() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto now = clock_.now();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t RobotsCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace MineSpec
