/**
 * @file ShareLink.cpp
 * @brief Receive links and local address discovery
 */

#include "peerdrop/ShareLink.h"
#include "peerdrop/Debug.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace PeerDrop {

std::string buildShareOrigin(const std::string& host, uint16_t port) {
    return "http://" + host + ":" + std::to_string(port);
}

std::string buildShareUrl(const std::string& origin) {
    return origin + SHARE_RECEIVE_QUERY;
}

bool isPrivateIpv4(const std::string& address) {
    in_addr parsed{};
    if (inet_pton(AF_INET, address.c_str(), &parsed) != 1) {
        return false;
    }

    const uint32_t ip = ntohl(parsed.s_addr);
    const uint8_t first = static_cast<uint8_t>(ip >> 24);
    const uint8_t second = static_cast<uint8_t>((ip >> 16) & 0xFF);

    if (first == 10) {
        return true;
    }
    if (first == 172 && second >= 16 && second <= 31) {
        return true;
    }
    return first == 192 && second == 168;
}

std::string getLocalIpAddress() {
    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        LOG_WARNING("getifaddrs() failed; using localhost");
        return "localhost";
    }

    std::string result = "localhost";
    for (ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        const auto* addr = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        char ipStr[INET_ADDRSTRLEN] = {};
        if (!inet_ntop(AF_INET, &addr->sin_addr, ipStr, sizeof(ipStr))) {
            continue;
        }
        if (isPrivateIpv4(ipStr)) {
            result = ipStr;
            break;
        }
    }

    freeifaddrs(interfaces);
    return result;
}

}  // namespace PeerDrop
