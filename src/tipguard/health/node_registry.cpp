// NodeRegistry: RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view of both pools.
//   • Writers: lock write_mu_, copy current state, mutate, atomic_store (RELEASE).
// The shared_ptr reference count naturally provides a grace period:
// old snapshots remain alive until the last reader drops its ref, after which
// they are reclaimed automatically (no explicit epoch/hazard management).

#include "tipguard/health/node_registry.hpp"

#include <algorithm>
#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <string>

namespace tipguard::health {

//------------------------------- Validation -----------------------------------

bool NodeRegistry::validate_url(std::string_view url) noexcept {
    if (url.empty() || url.size() > Limits::MaxUrlLen) return false;
    // No whitespace or control characters anywhere in an endpoint.
    for (char c : url) {
        if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f) return false;
    }
    return url.find("://") != std::string_view::npos;
}

//------------------------------- Public API -----------------------------------

std::shared_ptr<const PoolState> NodeRegistry::snapshot() const noexcept {
    // RCU read: acquire ensures any reader observing the pointer also observes
    // the fully constructed state published with RELEASE in writer path.
    return std::atomic_load_explicit(&state_, std::memory_order_acquire);
}

NodeList NodeRegistry::active() const {
    return snapshot()->active; // copy
}

NodeList NodeRegistry::poverty() const {
    return snapshot()->poverty; // copy
}

std::size_t NodeRegistry::active_size() const noexcept {
    return snapshot()->active.size();
}

std::size_t NodeRegistry::poverty_size() const noexcept {
    return snapshot()->poverty.size();
}

std::optional<Node> NodeRegistry::find(NodeId id) const {
    auto snap = snapshot();
    const auto by_id = [id](const Node& n) { return n.id == id; };
    if (auto it = std::find_if(snap->active.begin(), snap->active.end(), by_id); it != snap->active.end()) {
        return *it;
    }
    if (auto it = std::find_if(snap->poverty.begin(), snap->poverty.end(), by_id); it != snap->poverty.end()) {
        return *it;
    }
    return std::nullopt;
}

tipguard_detail::expected<NodeId, RegistryErr>
NodeRegistry::add_node(std::string_view url, std::string_view ws_url, std::shared_ptr<NodeClient> client) {
    if (!validate_url(url) || !client || (!ws_url.empty() && !validate_url(ws_url))) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return tipguard_detail::unexpected(RegistryErr::Invalid);
    }

    RegistryErr err = RegistryErr::Ok;
    NodeId id = 0;
    mutate([&](PoolState& s) {
        if (s.active.size() + s.poverty.size() >= Limits::MaxNodes) {
            err = RegistryErr::Capacity;
            return false;
        }
        const auto same_url = [url](const Node& n) { return n.url == url; };
        if (std::any_of(s.active.begin(), s.active.end(), same_url) ||
            std::any_of(s.poverty.begin(), s.poverty.end(), same_url)) {
            err = RegistryErr::Exists;
            return false;
        }
        id = next_id_.fetch_add(1, std::memory_order_relaxed);
        s.active.push_back(Node{id, std::string(url), std::string(ws_url), false, std::move(client)});
        return true;
    });

    if (err != RegistryErr::Ok) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return tipguard_detail::unexpected(err);
    }
    adds_.fetch_add(1, std::memory_order_relaxed);
    return id;
}

RegistryErr NodeRegistry::remove_node(NodeId id) {
    const bool erased = mutate([id](PoolState& s) {
        const auto by_id = [id](const Node& n) { return n.id == id; };
        const auto before = s.active.size() + s.poverty.size();
        std::erase_if(s.active, by_id);
        std::erase_if(s.poverty, by_id);
        return s.active.size() + s.poverty.size() != before;
    });
    if (!erased) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return RegistryErr::NotFound;
    }
    removes_.fetch_add(1, std::memory_order_relaxed);
    return RegistryErr::Ok;
}

void NodeRegistry::clear() noexcept {
    std::lock_guard<std::mutex> lk(write_mu_);
    publish(std::make_shared<PoolState>());
    // Not counting as failure/success here; treated as maintenance op.
}

NodeRegistry::Stats NodeRegistry::stats() const noexcept {
    return Stats{adds_.load(std::memory_order_relaxed),
                 removes_.load(std::memory_order_relaxed),
                 mutations_.load(std::memory_order_relaxed),
                 failures_.load(std::memory_order_relaxed)};
}

//------------------------------- Publication ----------------------------------

void NodeRegistry::publish(std::shared_ptr<PoolState> next) noexcept {
    // RCU update: publish new snapshot. RELEASE pairs with reader ACQUIRE so that
    // all prior writes to *next (the new state) are visible to readers that load it.
    std::shared_ptr<const PoolState> cnext = std::move(next); // convert PoolState -> const PoolState
    std::atomic_store_explicit(&state_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace tipguard::health
