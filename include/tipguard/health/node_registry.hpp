#pragma once
// tipguard: NodeRegistry
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Both pools (active + poverty) live in ONE immutable PoolState, so every
//     published snapshot shows them disjoint. There is no window in which a
//     reader can see a node in both pools or in neither.
//   • Readers (request dispatch, admin, poller) take a snapshot with ACQUIRE
//     semantics and never block, never block writers.
//   • Writers (arbiters, drop handler, admin) are serialized by write_mu_,
//     copy the state, mutate, and publish with RELEASE semantics.
//   • write_mu_ is held only for the list mutation. Never call into a
//     NodeClient (or anything else that can block) from inside mutate().
// Runtime policy: C++23, no exceptions, bounded memory (capacity limits).

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

#include "tipguard/compat/expected.hpp"
#include "tipguard/health/node.hpp"

namespace tipguard::health {

// -----------------------------------------------------------------------------
// Error codes returned by registry operations. Never throw exceptions.
// -----------------------------------------------------------------------------
/// Result codes for administrative mutations.
enum class RegistryErr {
    Ok,         ///< Operation succeeded.
    Exists,     ///< A node with the same URL is already registered.
    NotFound,   ///< No node with that id.
    Invalid,    ///< Input validation failed (empty/oversized URL, null client).
    Capacity    ///< Operation rejected due to configured capacity limits.
};

// -----------------------------------------------------------------------------
// Hard limits for bounded memory usage.
// -----------------------------------------------------------------------------
/// Compile-time capacity and field limits.
struct Limits {
    static constexpr std::size_t MaxNodes  = 256;   ///< Max nodes across both pools.
    static constexpr std::size_t MaxUrlLen = 2048;  ///< Max length for endpoint URLs.
};

/// Both pools, published together.
struct PoolState {
    NodeList active;   ///< Nodes eligible to serve traffic.
    NodeList poverty;  ///< Quarantined nodes pending recovery.
};

// -----------------------------------------------------------------------------
// NodeRegistry class
// -----------------------------------------------------------------------------
///
/// Shared home of the active and poverty pools.
/// - Read-mostly workload: optimized with snapshot-swap (RCU-like).
/// - Writes: copy-on-write of both pools, atomic swap, version increment.
/// - Node ids are assigned here and never reused, so poll results can be
///   applied by identity even if the pools changed since the poll snapshot.
///
class NodeRegistry final {
public:
    NodeRegistry() = default;
    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of both pools.
    std::shared_ptr<const PoolState> snapshot() const noexcept;

    /// Copies of the individual pools (taken from one snapshot each).
    [[nodiscard]] NodeList active() const;
    [[nodiscard]] NodeList poverty() const;

    [[nodiscard]] std::size_t active_size() const noexcept;
    [[nodiscard]] std::size_t poverty_size() const noexcept;

    /// Locate a node in either pool.
    [[nodiscard]] std::optional<Node> find(NodeId id) const;

    /// Monotonic version counter. Increments on every published mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Register a node into the active pool. Returns its new id.
    tipguard_detail::expected<NodeId, RegistryErr>
    add_node(std::string_view url, std::string_view ws_url, std::shared_ptr<NodeClient> client);

    /// Remove a node from whichever pool holds it.
    RegistryErr remove_node(NodeId id);

    /// Drop every node. Treated as maintenance op.
    void clear() noexcept;

    /**
     * @brief Exclusive copy-on-write mutation of both pools.
     * @param fn Callable `bool(PoolState&)`; return true to publish the edit.
     * @return true if a new snapshot was published.
     */
    template <class Fn>
    bool mutate(Fn&& fn);

    // --------------------------- Observability -------------------------------
    /// Stats counters (atomic, cumulative since start).
    struct Stats {
        uint64_t adds{0}, removes{0}, mutations{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    static bool validate_url(std::string_view url) noexcept;

    // Caller holds write_mu_.
    void publish(std::shared_ptr<PoolState> next) noexcept;

    // Current snapshot of both pools (shared_ptr for RCU semantics).
    std::shared_ptr<const PoolState> state_{std::make_shared<PoolState>()};
    mutable std::mutex write_mu_;   ///< Serializes writers only.
    std::atomic<uint64_t> version_{0};
    std::atomic<NodeId>   next_id_{1};

    // Counters for observability.
    std::atomic<uint64_t> adds_{0}, removes_{0}, mutations_{0}, failures_{0};
};

template <class Fn>
bool NodeRegistry::mutate(Fn&& fn) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto next = std::make_shared<PoolState>(*snapshot()); // copy-on-write
    if (!std::forward<Fn>(fn)(*next)) return false;
    publish(std::move(next));
    mutations_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

} // namespace tipguard::health
