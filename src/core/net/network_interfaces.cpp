#include "remotectl/core/net/network_interfaces.hpp"
#include "remotectl/core/util/error_types.hpp"
#include "remotectl/core/util/logger.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace remotectl {

    namespace {
        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool looksLikeLan(const std::string& name) {
            const std::string n = lower(name);
            return n.find("en") != std::string::npos
                || n.find("wl") != std::string::npos
                || n.find("eth") != std::string::npos;
        }

        bool isLoopbackAddress(const std::string& address) {
            return address.rfind("127.", 0) == 0;
        }
    }

    std::vector<InterfaceAddress> listIPv4Interfaces() {
        ifaddrs* head = nullptr;
        if (getifaddrs(&head) != 0) {
            throw RemotePeerError(PeerErr::NetworkError,
                                  std::string("Failed to list network interfaces: ") + std::strerror(errno));
        }

        std::vector<InterfaceAddress> out;
        for (ifaddrs* it = head; it; it = it->ifa_next) {
            if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
            if (!(it->ifa_flags & IFF_UP)) continue;

            char buf[INET_ADDRSTRLEN]{};
            auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
            if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;

            InterfaceAddress ia;
            ia.name = it->ifa_name ? it->ifa_name : "";
            ia.address = buf;
            ia.loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
            out.push_back(std::move(ia));
        }
        freeifaddrs(head);

        LOG_DEBUG("Found " + std::to_string(out.size()) + " IPv4 interface address(es)");
        return out;
    }

    std::optional<std::string> selectLanAddress(const std::vector<InterfaceAddress>& interfaces) {
        auto usable = [](const InterfaceAddress& ia) {
            return !ia.loopback && !isLoopbackAddress(ia.address) && !ia.address.empty();
        };

        for (const auto& ia : interfaces) {
            if (usable(ia) && looksLikeLan(ia.name)) return ia.address;
        }
        for (const auto& ia : interfaces) {
            if (usable(ia)) return ia.address;
        }
        return std::nullopt;
    }

}
