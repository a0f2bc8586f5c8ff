#pragma once
/**
 * @file head_poller.hpp
 * @brief Scatter-gather of `block_number` over a pool with a per-node deadline.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

#include "tipguard/compat/expected.hpp"
#include "tipguard/health/error.hpp"
#include "tipguard/health/node.hpp"

namespace tipguard::health {

/**
 * @struct HeadResult
 * @brief What one node reported during one poll.
 *
 * @note `head` is empty when the node errored or missed the deadline; a
 *       present head of 0 is a genuine answer, not a failure marker.
 */
struct HeadResult {
    std::size_t                index{0};      ///< Position in the polled snapshot
    NodeId                     node_id{0};    ///< Identity used to apply the result
    std::optional<BlockNumber> head;          ///< Reported head (empty = unresponsive)
    std::optional<FetchError>  error;         ///< Why `head` is empty (unset when responsive)

    bool responsive() const noexcept { return head.has_value(); }

    static HeadResult reported(std::size_t i, NodeId id, BlockNumber h) noexcept {
        return HeadResult{i, id, h, std::nullopt};
    }
    static HeadResult unresponsive(std::size_t i, NodeId id, FetchError why = FetchError::Timeout) noexcept {
        return HeadResult{i, id, std::nullopt, why};
    }
};

using HeadResults = std::vector<HeadResult>;

/**
 * @brief Ask every node of @p pool for its head, concurrently.
 *
 * Each node gets its own task; the caller waits at most @p timeout for the
 * whole batch (all tasks start together, so this is also the per-node cap).
 * Nodes without an answer by then are reported unresponsive. A node whose
 * fetch from an earlier poll is still running is not asked again.
 *
 * @return One result per node, in pool order. Empty pool → empty result.
 *         Fails only with HealthError::ChannelClosed if result delivery breaks.
 */
tipguard_detail::expected<HeadResults, HealthError>
poll_heads(const NodeList& pool, std::chrono::milliseconds timeout);

/// Number of node fetches started by poll_heads() that have not returned yet.
/// At most one per client: a node whose previous fetch is still running is
/// reported unresponsive (FetchError::Timeout) without a new fetch.
std::size_t fetches_in_flight();

} // namespace tipguard::health
