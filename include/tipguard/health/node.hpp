/**
 * @file node.hpp
 * @brief Upstream RPC node handle shared by the registry, poller and arbiters.
 *
 * A `Node` is a cheap value: copying it copies the endpoint strings and bumps
 * the refcount of the client capability. Cross-pool moves are always
 * "copy into destination, then remove from source".
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tipguard::health {

class NodeClient; // forward decl (node_client.hpp)

/// Stable node identity assigned by the registry. Never reused.
using NodeId = std::uint64_t;

/// Block height as reported by a node.
using BlockNumber = std::uint64_t;

/**
 * @brief One upstream JSON-RPC endpoint.
 *
 * @note `is_erroring` is an in-flight marker for a single arbitration pass.
 *       Pool membership, not the flag, decides whether the node serves traffic.
 */
struct Node final {
  /// Registry-assigned identity (0 = not registered).
  NodeId id{0};

  /// HTTP endpoint, e.g. "https://eth.example:8545".
  std::string url;

  /// WebSocket endpoint (may be empty when WS mode is off).
  std::string ws_url;

  /// True while the node is being quarantined or sits in the poverty pool.
  bool is_erroring{false};

  /// Capability used to fetch the node's head.
  std::shared_ptr<NodeClient> client;

  /// Identity and status equality (the client handle is not compared).
  bool operator==(const Node& o) const noexcept {
    return id == o.id && url == o.url && ws_url == o.ws_url && is_erroring == o.is_erroring;
  }
};

/**
 * @brief Ordered pool of nodes.
 */
using NodeList = std::vector<Node>;

} // namespace tipguard::health
