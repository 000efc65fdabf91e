#include "remotectl/core/types.hpp"

namespace remotectl {

    std::string_view toString(SessionRole role) noexcept {
        switch (role) {
            case SessionRole::Host:   return "host";
            case SessionRole::Remote: return "remote";
        }
        return "unknown";
    }

    std::string_view toString(SessionStatus status) noexcept {
        switch (status) {
            case SessionStatus::Disconnected: return "disconnected";
            case SessionStatus::Connecting:   return "connecting";
            case SessionStatus::Connected:    return "connected";
            case SessionStatus::Reconnecting: return "reconnecting";
            case SessionStatus::Error:        return "error";
        }
        return "unknown";
    }

}
