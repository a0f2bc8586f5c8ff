#pragma once
/**
 * @file collaborators.hpp
 * @brief Interfaces and messages exchanged with the rest of the balancer.
 * @details The WS connection manager, subscription dispatcher and the
 *          safe/finalized block tracker are owned by the embedding process;
 *          the health core sees them only through these types.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "tipguard/compat/expected.hpp"
#include "tipguard/health/error.hpp"

namespace tipguard::health {

class NodeRegistry; // forward decl

/**
 * @struct TransportFailure
 * @brief A WebSocket transport to an active-pool node closed.
 */
struct TransportFailure {
    std::size_t active_index{0}; ///< Index of the node in the active pool when it failed
};

/**
 * @enum WsCommand
 * @brief Requests sent to the WS connection manager.
 */
enum class WsCommand : std::uint8_t {
    Reconnect = 1 ///< Rebuild WS connections against the current active pool
};

/**
 * @enum MigrationError
 * @brief Why a subscription migration did not complete.
 */
enum class MigrationError : std::uint8_t {
    NoTarget = 1,   ///< No other node to move subscriptions to
    Rejected,       ///< Target refused one or more subscribe calls
    ChannelClosed   ///< Dispatcher channels are gone
};

/**
 * @class SafeBlockRefresher
 * @brief Refreshes the safe/finalized block tracker once per health cycle.
 */
class SafeBlockRefresher {
public:
    virtual ~SafeBlockRefresher() = default;

    /**
     * @param registry Pools to query (implementations read the active pool).
     * @param budget   Time budget for the refresh (the health interval).
     */
    virtual tipguard_detail::expected<void, HealthError>
    refresh(const NodeRegistry& registry, std::chrono::milliseconds budget) = 0;
};

/**
 * @class SubscriptionMover
 * @brief Moves live subscriptions away from a dropped WS connection.
 */
class SubscriptionMover {
public:
    virtual ~SubscriptionMover() = default;

    /// @param dropped_index Active-pool index of the dropped connection.
    virtual tipguard_detail::expected<void, MigrationError>
    move_subscriptions(std::size_t dropped_index) = 0;
};

} // namespace tipguard::health
