/**
 * @file resolver.hpp
 * @brief Host name resolution seam for the safety gate
 */

#pragma once

#include <gate/ip_policy.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace MineSpec {

class Resolver {
public:
    virtual ~Resolver() = default;

    /**
     * @return Every address the name resolves to; empty when resolution fails
     */
    virtual std::vector<IpAddress> resolve(const std::string& host) = 0;
};

/**
 * @brief getaddrinfo(3), both address families
 */
class SystemResolver : public Resolver {
public:
    std::vector<IpAddress> resolve(const std::string& host) override;
};

/**
 * @brief Fixed answers, for tests and offline runs
 */
class StaticResolver : public Resolver {
public:
    void set(const std::string& host, std::vector<IpAddress> addresses);

    std::vector<IpAddress> resolve(const std::string& host) override;

    size_t lookups() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<IpAddress>> answers_;
    size_t lookups_ = 0;
};

} // namespace MineSpec
