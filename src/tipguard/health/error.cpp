#include "tipguard/health/error.hpp"

namespace tipguard::health {

std::string_view to_string(HealthError e) noexcept {
    switch (e) {
        case HealthError::ChannelClosed:     return "channel_closed";
        case HealthError::ProtocolViolation: return "protocol_violation";
        case HealthError::RefreshFailed:     return "refresh_failed";
    }
    return "unknown";
}

std::string_view to_string(FetchError e) noexcept {
    switch (e) {
        case FetchError::Transport: return "transport";
        case FetchError::Timeout:   return "timeout";
        case FetchError::Malformed: return "malformed";
    }
    return "unknown";
}

} // namespace tipguard::health
