#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the health-arbitration core.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in production deployments.
 */

#include <cstdint>

namespace tipguard::config::constants {

// =====================
// Health loop cadence
// Units: milliseconds
// =====================
inline constexpr uint64_t HEALTH_CHECK_INTERVAL_MS = 2000; ///< Sleep between health cycles
inline constexpr uint64_t HEAD_QUERY_TTL_MS        = 300;  ///< Per-node block number deadline

// =====================
// Feature switches
// =====================
inline constexpr bool HEALTH_CHECK_ENABLED = true;  ///< Run the health loop at all
inline constexpr bool WS_MODE_ENABLED      = false; ///< WebSocket transports (drop handler)

// =====================
// Head poller
// =====================
/// Fan-in channel is sized to the pool; an empty pool still gets one slot.
inline constexpr uint64_t POLLER_MIN_FANIN_CAPACITY = 1;

// =====================
// Reconnect requests
// =====================
/// Pending reconnect requests kept before new ones are dropped.
inline constexpr uint64_t RECONNECT_QUEUE_CAPACITY = 64;

} // namespace tipguard::config::constants
