#include "remotectl/core/net/endpoint.hpp"
#include "remotectl/core/util/error_types.hpp"
#include <charconv>

namespace remotectl {

    namespace {
        bool startsWithNoCase(std::string_view s, std::string_view prefix) {
            if (s.size() < prefix.size()) return false;
            for (size_t i = 0; i < prefix.size(); ++i) {
                char c = s[i];
                if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
                if (c != prefix[i]) return false;
            }
            return true;
        }

        uint16_t parsePort(std::string_view digits, std::string_view address) {
            unsigned value = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()
                || value == 0 || value > 65535) {
                throw RemotePeerError(PeerErr::ConnectionFailed,
                                      "Invalid port in host address: " + std::string(address));
            }
            return static_cast<uint16_t>(value);
        }
    }

    std::string Endpoint::url() const {
        std::string out = secure ? "wss://" : "ws://";
        if (host.find(':') != std::string::npos) out += "[" + host + "]";
        else out += host;
        out += ":" + std::to_string(port) + path;
        return out;
    }

    Endpoint parseHostAddress(std::string_view address, uint16_t defaultPort, std::string_view path) {
        Endpoint ep;
        ep.port = defaultPort;
        ep.path = std::string(path);

        std::string_view rest = address;
        while (!rest.empty() && (rest.front() == ' ' || rest.front() == '\t')) rest.remove_prefix(1);
        while (!rest.empty() && (rest.back() == ' ' || rest.back() == '\t')) rest.remove_suffix(1);

        if (startsWithNoCase(rest, "https://")) {
            ep.secure = true;
            rest.remove_prefix(8);
        } else if (startsWithNoCase(rest, "wss://")) {
            ep.secure = true;
            rest.remove_prefix(6);
        } else if (startsWithNoCase(rest, "http://")) {
            rest.remove_prefix(7);
        } else if (startsWithNoCase(rest, "ws://")) {
            rest.remove_prefix(5);
        }

        if (auto slash = rest.find('/'); slash != std::string_view::npos)
            rest = rest.substr(0, slash);

        if (!rest.empty() && rest.front() == '[') {
            auto close = rest.find(']');
            if (close == std::string_view::npos)
                throw RemotePeerError(PeerErr::ConnectionFailed,
                                      "Invalid host address: " + std::string(address));
            ep.host = std::string(rest.substr(1, close - 1));
            std::string_view tail = rest.substr(close + 1);
            if (!tail.empty()) {
                if (tail.front() != ':')
                    throw RemotePeerError(PeerErr::ConnectionFailed,
                                          "Invalid host address: " + std::string(address));
                ep.port = parsePort(tail.substr(1), address);
            }
        } else {
            auto colon = rest.rfind(':');
            if (colon != std::string_view::npos) {
                ep.host = std::string(rest.substr(0, colon));
                ep.port = parsePort(rest.substr(colon + 1), address);
            } else {
                ep.host = std::string(rest);
            }
        }

        if (ep.host.empty())
            throw RemotePeerError(PeerErr::ConnectionFailed,
                                  "Invalid host address: " + std::string(address));
        return ep;
    }

}
