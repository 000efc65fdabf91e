#include "remotectl/core/util/error_types.hpp"

namespace remotectl {

    std::string_view toString(PeerErr kind) noexcept {
        switch (kind) {
            case PeerErr::ConnectionFailed: return "connectionFailed";
            case PeerErr::PeerDisconnected: return "peerDisconnected";
            case PeerErr::DataChannelError: return "dataChannelError";
            case PeerErr::ServerError:      return "serverError";
            case PeerErr::Timeout:          return "timeout";
            case PeerErr::InvalidSession:   return "invalidSession";
            case PeerErr::AuthFailed:       return "authFailed";
            case PeerErr::NetworkError:     return "networkError";
            case PeerErr::Unknown:          return "unknown";
        }
        return "unknown";
    }

}
