#pragma once
/**
 * @file arbiter.hpp
 * @brief Consensus-by-maximum arbitration between the active and poverty pools.
 *
 * Rules:
 *  - The agreed head is the highest head any polled node reported.
 *  - An active node is demoted when it reports less than the agreed head, or
 *    gives no answer while at least one other node did.
 *  - A poverty node is promoted when it reports at least the agreed head.
 *  - A node reporting exactly the agreed head is never demoted.
 *
 * Results are applied by NodeId: nodes that left the pool since the poll are
 * skipped, and a result never touches a node in the other pool.
 */

#include "tipguard/compat/expected.hpp"
#include "tipguard/health/error.hpp"
#include "tipguard/health/head_poller.hpp"
#include "tipguard/health/node_registry.hpp"
#include "tipguard/obs/observability.hpp"

namespace tipguard::health {

/// Highest responsive head in @p heads; 0 if empty or nobody answered.
BlockNumber agreed_head(const HeadResults& heads) noexcept;

/**
 * @brief Move laggards of the active pool into the poverty pool.
 * @param registry Pools to partition.
 * @param heads    Poll results for the active pool.
 * @param obs      Sink for one Demoted event per demoted node.
 * @return The agreed head of this pass.
 */
tipguard_detail::expected<BlockNumber, HealthError>
make_poverty(NodeRegistry& registry, const HeadResults& heads,
             obs::Observer& obs = *obs::make_log_observer());

/**
 * @brief Move poverty nodes that caught up back into the active pool.
 * @param registry Pools to partition.
 * @param heads    Poll results for the poverty pool.
 * @param agreed   Agreed head from make_poverty() of the same cycle.
 * @param obs      Sink for one Promoted event per promoted node.
 */
tipguard_detail::expected<void, HealthError>
escape_poverty(NodeRegistry& registry, const HeadResults& heads, BlockNumber agreed,
               obs::Observer& obs = *obs::make_log_observer());

} // namespace tipguard::health
