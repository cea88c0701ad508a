/**
 * @file resolver.cpp
 * @brief Resolver implementations
 */

#include <gate/resolver.hpp>
#include <utils/logger.hpp>
#include <netdb.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <algorithm>
#include <cstring>
#include <memory>

namespace MineSpec {

std::vector<IpAddress> SystemResolver::resolve(const std::string& host) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &raw);
    if (rc != 0) {
        Logger::debug("DNS lookup failed for " + host + ": " + gai_strerror(rc));
        return {};
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> list(raw, &freeaddrinfo);

    std::vector<IpAddress> out;
    for (addrinfo* ai = list.get(); ai != nullptr; ai = ai->ai_next) {
        IpAddress addr;
        if (ai->ai_family == AF_INET) {
            const auto* sin = reinterpret_cast<const sockaddr_in*>(ai->ai_addr);
            addr.v6 = false;
            std::memcpy(addr.bytes.data(), &sin->sin_addr, 4);
        } else if (ai->ai_family == AF_INET6) {
            const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(ai->ai_addr);
            addr.v6 = true;
            std::memcpy(addr.bytes.data(), &sin6->sin6_addr, 16);
        } else {
            continue;
        }
        if (std::find(out.begin(), out.end(), addr) == out.end()) out.push_back(addr);
    }
    return out;
}

void StaticResolver::set(const std::string& host, std::vector<IpAddress> addresses) {
    std::lock_guard<std::mutex> lock(mutex_);
    answers_[host] = std::move(addresses);
}

std::vector<IpAddress> StaticResolver::resolve(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++lookups_;
    auto it = answers_.find(host);
    return it == answers_.end() ? std::vector<IpAddress>{} : it->second;
}

size_t StaticResolver::lookups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookups_;
}

} // namespace MineSpec
