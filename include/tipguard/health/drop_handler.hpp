#pragma once
/**
 * @file drop_handler.hpp
 * @brief Quarantines nodes whose WebSocket transport failed.
 *
 * Per notification:
 *  1) one registry mutation moves active[index] into the poverty pool (no-op
 *     if the index is gone),
 *  2) subscriptions are migrated away from that index (best-effort),
 *  3) a reconnect request is offered to the WS manager (send-or-drop).
 * Steps 2 and 3 run even when step 1 was a no-op.
 */

#include <cstddef>
#include <memory>

#include "tipguard/compat/expected.hpp"
#include "tipguard/health/collaborators.hpp"
#include "tipguard/health/error.hpp"
#include "tipguard/health/node_registry.hpp"
#include "tipguard/mem/channel.hpp"
#include "tipguard/obs/observability.hpp"

namespace tipguard::health {

using FailureChannel = mem::Channel<TransportFailure>;
using CommandChannel = mem::Channel<WsCommand>;

class DropHandler {
public:
    DropHandler(NodeRegistry& registry, SubscriptionMover& mover,
                std::shared_ptr<FailureChannel> failures,
                std::shared_ptr<CommandChannel> commands,
                obs::Observer& obs = *obs::make_log_observer()) noexcept
        : registry_(registry), mover_(mover),
          failures_(std::move(failures)), commands_(std::move(commands)), obs_(obs) {}

    /**
     * @brief Consume notifications until the failure channel closes.
     * @return Always HealthError::ProtocolViolation: the channel is expected
     *         to stay open for the life of the process.
     */
    tipguard_detail::expected<void, HealthError> run();

    /**
     * @brief Handle one notification.
     * @return true if a node was moved to the poverty pool.
     */
    bool handle(const TransportFailure& failure);

private:
    NodeRegistry&                   registry_;
    SubscriptionMover&              mover_;
    std::shared_ptr<FailureChannel> failures_;
    std::shared_ptr<CommandChannel> commands_;
    obs::Observer&                  obs_;
};

} // namespace tipguard::health
