/**
 * @file address.cpp
 * @brief IP address helpers.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/net/address.hpp"
#include "mcdisc/net/platform.hpp"
#include "mcdisc/net/udp_socket.hpp"
#include "mcdisc/utils/logger.hpp"

#ifndef _WIN32
#include <ifaddrs.h>
#include <net/if.h>
#endif

namespace mcdisc {
namespace net {

namespace {

// Any routable address works, the socket is never written to
const char* const kRouteLookupAddress = "8.8.8.8";
constexpr uint16_t kRouteLookupPort = 80;

std::optional<std::string> addressFromRoute() {
    UdpSocket router;
    if (!router.connect(SocketAddress(kRouteLookupAddress, kRouteLookupPort))) {
        return std::nullopt;
    }

    std::string local = router.getLocalAddress();
    if (local.empty() || local == "0.0.0.0") {
        return std::nullopt;
    }
    return local;
}

std::optional<std::string> addressFromInterfaces() {
#ifdef _WIN32
    return std::nullopt;
#else
    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        LOG_WARN("Address", "getifaddrs failed: error {}", getLastSocketError());
        return std::nullopt;
    }

    std::optional<std::string> found;
    for (struct ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        auto* in = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
        char ipStr[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &in->sin_addr, ipStr, sizeof(ipStr)) != nullptr) {
            LOG_DEBUG("Address", "Using address {} of interface {}", ipStr, it->ifa_name);
            found = std::string(ipStr);
            break;
        }
    }

    freeifaddrs(interfaces);
    return found;
#endif
}

}  // namespace

bool isValidIpAddress(const std::string& text) {
    struct in_addr v4{};
    struct in6_addr v6{};
    return inet_pton(AF_INET, text.c_str(), &v4) == 1 ||
           inet_pton(AF_INET6, text.c_str(), &v6) == 1;
}

bool isMulticastAddress(const std::string& text) {
    struct in_addr v4{};
    if (inet_pton(AF_INET, text.c_str(), &v4) != 1) {
        return false;
    }
    return (ntohl(v4.s_addr) & 0xF0000000u) == 0xE0000000u;
}

std::optional<std::string> resolveLocalAddress() {
    if (auto routed = addressFromRoute()) {
        LOG_DEBUG("Address", "Resolved local address {} from routing table", *routed);
        return routed;
    }
    return addressFromInterfaces();
}

}  // namespace net
}  // namespace mcdisc
