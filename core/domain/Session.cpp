#include "Session.hpp"

namespace iotagent::domain {

std::string stateToString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Connected: return "Connected";
        case SessionState::Reconnecting: return "Reconnecting";
        case SessionState::Closed: return "Closed";
        default: return "Unknown";
    }
}

} // namespace iotagent::domain
