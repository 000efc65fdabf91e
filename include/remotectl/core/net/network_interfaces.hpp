/**
 * @file network_interfaces.hpp
 * @brief Local IPv4 interface discovery for the host address.
 */
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace remotectl {

    /**
     * @struct InterfaceAddress
     * @brief One IPv4 address bound to a local interface.
     */
    struct InterfaceAddress {
        std::string name;        ///< interface name, e.g. "eth0", "wlan0", "en0"
        std::string address;     ///< dotted quad
        bool        loopback{ false };
    };

    /// Source of interface addresses; injectable so tests do not depend on the machine.
    using InterfaceProvider = std::function<std::vector<InterfaceAddress>()>;

    /**
     * @brief Enumerate the IPv4 addresses of interfaces that are up.
     * @throws RemotePeerError (NetworkError) when the OS enumeration fails
     */
    std::vector<InterfaceAddress> listIPv4Interfaces();

    /**
     * @brief Pick the address a controller on the LAN should dial.
     *
     * Loopback addresses are skipped. Interfaces whose name contains "en",
     * "wl" or "eth" (case-insensitive) win; otherwise the first remaining
     * address is used. Enumeration order breaks ties.
     *
     * @return std::nullopt when only loopback addresses exist
     */
    std::optional<std::string> selectLanAddress(const std::vector<InterfaceAddress>& interfaces);

}
