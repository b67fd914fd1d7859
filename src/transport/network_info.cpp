/**
 * @file network_info.cpp
 * @brief Local network interface lookup
 */

#include <portal/transport/network_info.h>
#include <portal/core/logging.h>

#include <cerrno>
#include <climits>
#include <cstring>

#if defined(__APPLE__) || defined(__linux__)
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace portal {

auto list_ipv4_interfaces() -> std::vector<network_interface> {
    std::vector<network_interface> interfaces;

#if defined(__APPLE__) || defined(__linux__)
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        PORTAL_LOG_WARN(log_category::transport,
            std::string("getifaddrs failed: ") + std::strerror(errno));
        return interfaces;
    }

    for (struct ifaddrs* addr = addrs; addr != nullptr; addr = addr->ifa_next) {
        if (addr->ifa_addr == nullptr || addr->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        auto* sin = reinterpret_cast<struct sockaddr_in*>(addr->ifa_addr);
        char ip_str[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &sin->sin_addr, ip_str, sizeof(ip_str)) == nullptr) {
            continue;
        }

        network_interface iface;
        iface.name = addr->ifa_name;
        iface.address = ip_str;
        iface.is_up = (addr->ifa_flags & IFF_UP) != 0;
        iface.is_loopback = (addr->ifa_flags & IFF_LOOPBACK) != 0;
        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(addrs);
#endif

    return interfaces;
}

auto primary_ipv4_address() -> std::string {
    for (const auto& iface : list_ipv4_interfaces()) {
        if (iface.is_up && !iface.is_loopback) {
            return iface.address;
        }
    }
    return "127.0.0.1";
}

auto local_hostname() -> std::string {
#if defined(__APPLE__) || defined(__linux__)
#ifdef HOST_NAME_MAX
    char name[HOST_NAME_MAX + 1] = {};
#else
    char name[256] = {};
#endif
    if (gethostname(name, sizeof(name) - 1) != 0) {
        PORTAL_LOG_WARN(log_category::transport,
            std::string("gethostname failed: ") + std::strerror(errno));
        return {};
    }
    return name;
#else
    return {};
#endif
}

}  // namespace portal
