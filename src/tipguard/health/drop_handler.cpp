/**
 * @file drop_handler.cpp
 * @brief Transport-failure listener.
 */
#include "tipguard/health/drop_handler.hpp"

#include <iterator>
#include <string>

#include <spdlog/spdlog.h>

namespace tipguard::health {

tipguard_detail::expected<void, HealthError> DropHandler::run() {
    TransportFailure failure;
    while (failures_->recv(failure) == mem::RecvStatus::Value) {
        (void)handle(failure);
    }
    spdlog::error("drop listener: transport failure channel closed");
    return tipguard_detail::unexpected(HealthError::ProtocolViolation);
}

bool DropHandler::handle(const TransportFailure& failure) {
    const std::size_t index = failure.active_index;

    std::string url;
    const bool moved = registry_.mutate([&](PoolState& s) {
        if (index >= s.active.size()) return false; // already gone
        Node dropped = s.active[index];
        dropped.is_erroring = true;
        url = dropped.url;
        s.poverty.push_back(std::move(dropped));
        s.active.erase(std::next(s.active.begin(), static_cast<std::ptrdiff_t>(index)));
        return true;
    });

    if (moved) {
        obs::HealthEvent e;
        e.kind  = obs::EventKind::Dropped;
        e.url   = url;
        e.index = index;
        auto snap = registry_.snapshot();
        e.active_size  = snap->active.size();
        e.poverty_size = snap->poverty.size();
        obs_.record(e);
    } else {
        spdlog::debug("drop listener: WS connection #{} no longer in the active pool", index);
    }

    // Outside the registry mutation: migration may block on the dispatcher.
    if (auto r = mover_.move_subscriptions(index); !r) {
        obs::HealthEvent m;
        m.kind  = obs::EventKind::MigrationFailed;
        m.url   = url;
        m.index = index;
        obs_.record(m);
    }

    if (!commands_->try_send(WsCommand::Reconnect)) {
        spdlog::debug("drop listener: reconnect request for #{} dropped", index);
    }
    return moved;
}

} // namespace tipguard::health
