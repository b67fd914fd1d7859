/**
 * @file network_info.h
 * @brief Local network interface lookup
 */

#ifndef PORTAL_TRANSPORT_NETWORK_INFO_H
#define PORTAL_TRANSPORT_NETWORK_INFO_H

#include <string>
#include <vector>

namespace portal {

struct network_interface {
    std::string name;
    std::string address;
    bool is_up = false;
    bool is_loopback = false;
};

/**
 * @brief IPv4 interfaces of this host, in system order
 */
[[nodiscard]] auto list_ipv4_interfaces() -> std::vector<network_interface>;

/**
 * @brief First non-loopback IPv4 address that is up, or "127.0.0.1"
 */
[[nodiscard]] auto primary_ipv4_address() -> std::string;

/**
 * @brief Host name of this machine, or empty if it cannot be read
 */
[[nodiscard]] auto local_hostname() -> std::string;

}  // namespace portal

#endif  // PORTAL_TRANSPORT_NETWORK_INFO_H
