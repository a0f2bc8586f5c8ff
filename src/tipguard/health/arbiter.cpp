/**
 * @file arbiter.cpp
 * @brief make_poverty / escape_poverty.
 */
#include "tipguard/health/arbiter.hpp"

#include <algorithm>
#include <vector>

namespace tipguard::health {

namespace {

obs::HealthEvent node_event(obs::EventKind kind, const Node& n, const HeadResult& r, BlockNumber agreed) {
    obs::HealthEvent e;
    e.kind          = kind;
    e.node_id       = n.id;
    e.url           = n.url;
    e.responsive    = r.responsive();
    e.reported_head = r.head.value_or(0);
    e.agreed_head   = agreed;
    return e;
}

void publish_events(std::vector<obs::HealthEvent>& events, const NodeRegistry& registry, obs::Observer& obs) {
    if (events.empty()) return;
    auto snap = registry.snapshot();
    for (auto& e : events) {
        e.active_size  = snap->active.size();
        e.poverty_size = snap->poverty.size();
        obs.record(e);
    }
}

} // namespace

BlockNumber agreed_head(const HeadResults& heads) noexcept {
    BlockNumber highest = 0;
    for (const auto& r : heads) {
        if (r.head && *r.head > highest) highest = *r.head;
    }
    return highest;
}

tipguard_detail::expected<BlockNumber, HealthError>
make_poverty(NodeRegistry& registry, const HeadResults& heads, obs::Observer& obs) {
    const BlockNumber agreed = agreed_head(heads);
    const bool anyone_answered = std::any_of(heads.begin(), heads.end(),
                                             [](const HeadResult& r) { return r.responsive(); });
    // Unresponsive ranks below every answer. If nobody answered there is no
    // reference to fall behind, so nobody is demoted.
    const auto lagging = [&](const HeadResult& r) {
        return r.responsive() ? *r.head < agreed : anyone_answered;
    };

    std::vector<obs::HealthEvent> events;
    registry.mutate([&](PoolState& s) {
        for (const auto& r : heads) {
            if (!lagging(r)) continue;
            auto it = std::find_if(s.active.begin(), s.active.end(),
                                   [&](const Node& n) { return n.id == r.node_id; });
            if (it == s.active.end() || it->is_erroring) continue;

            it->is_erroring = true;
            s.poverty.push_back(*it);
            events.push_back(node_event(obs::EventKind::Demoted, *it, r, agreed));
        }
        std::erase_if(s.active, [](const Node& n) { return n.is_erroring; });
        return !events.empty();
    });

    publish_events(events, registry, obs);
    return agreed;
}

tipguard_detail::expected<void, HealthError>
escape_poverty(NodeRegistry& registry, const HeadResults& heads, BlockNumber agreed, obs::Observer& obs) {
    std::vector<obs::HealthEvent> events;
    registry.mutate([&](PoolState& s) {
        for (const auto& r : heads) {
            if (!r.responsive() || *r.head < agreed) continue;
            auto it = std::find_if(s.poverty.begin(), s.poverty.end(),
                                   [&](const Node& n) { return n.id == r.node_id; });
            if (it == s.poverty.end() || !it->is_erroring) continue;

            Node recovered = *it;
            recovered.is_erroring = false;
            s.active.push_back(std::move(recovered));
            it->is_erroring = false; // marks the slot for the filter below
            events.push_back(node_event(obs::EventKind::Promoted, *it, r, agreed));
        }
        std::erase_if(s.poverty, [](const Node& n) { return !n.is_erroring; });
        return !events.empty();
    });

    publish_events(events, registry, obs);
    return {};
}

} // namespace tipguard::health
