#pragma once
/**
 * @file error.hpp
 * @brief Error codes of the health subsystem. Never thrown; returned via expected.
 */

#include <cstdint>
#include <string_view>

namespace tipguard::health {

/**
 * @enum HealthError
 * @brief Fatal errors that terminate the owning loop.
 */
enum class HealthError : std::uint8_t {
    ChannelClosed = 1,   ///< Internal fan-in channel closed before all results arrived
    ProtocolViolation,   ///< Event channel closed while the loop expected it open
    RefreshFailed        ///< Safe/finalized block refresh reported failure
};

/**
 * @enum FetchError
 * @brief Per-node query failures. Absorbed by the poller, never propagated.
 */
enum class FetchError : std::uint8_t {
    Transport = 1,  ///< Connection refused/reset, HTTP error
    Timeout,        ///< Deadline exceeded
    Malformed       ///< Response could not be decoded
};

/// Short label for log lines.
std::string_view to_string(HealthError e) noexcept;

/// Short label for log lines.
std::string_view to_string(FetchError e) noexcept;

} // namespace tipguard::health
