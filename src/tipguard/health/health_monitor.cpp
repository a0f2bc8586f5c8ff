/**
 * @file health_monitor.cpp
 * @brief Health loop orchestration.
 */
#include "tipguard/health/health_monitor.hpp"
#include "tipguard/health/arbiter.hpp"
#include "tipguard/health/head_poller.hpp"

#include <spdlog/spdlog.h>

namespace tipguard::health {

tipguard_detail::expected<void, HealthError> HealthMonitor::run() {
    while (sleep_for(settings().interval)) {
        auto r = run_cycle();
        if (!r) {
            spdlog::error("health check stopped: {}", to_string(r.error()));
            return tipguard_detail::unexpected(r.error());
        }
    }
    spdlog::info("health check stopped on request");
    return {};
}

tipguard_detail::expected<BlockNumber, HealthError> HealthMonitor::run_cycle() {
    const HealthSettings s = settings();
    spdlog::debug("checking RPC health (ttl {} ms)", s.ttl.count());

    // Active pass first: the poverty pass is judged against its agreed head.
    auto heads = poll_heads(registry_.active(), s.ttl);
    if (!heads) return tipguard_detail::unexpected(heads.error());
    auto agreed = make_poverty(registry_, *heads, obs_);
    if (!agreed) return tipguard_detail::unexpected(agreed.error());

    auto poverty_heads = poll_heads(registry_.poverty(), s.ttl);
    if (!poverty_heads) return tipguard_detail::unexpected(poverty_heads.error());
    if (auto esc = escape_poverty(registry_, *poverty_heads, *agreed, obs_); !esc) {
        return tipguard_detail::unexpected(esc.error());
    }

    {
        auto snap = registry_.snapshot();
        obs::HealthEvent e;
        e.kind         = obs::EventKind::CycleCompleted;
        e.agreed_head  = *agreed;
        e.active_size  = snap->active.size();
        e.poverty_size = snap->poverty.size();
        obs_.record(e);
    }

    if (auto ref = refresher_.refresh(registry_, s.interval); !ref) {
        return tipguard_detail::unexpected(ref.error());
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        ++cycles_;
    }
    return *agreed;
}

void HealthMonitor::request_stop() noexcept {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    wake_.notify_all();
}

bool HealthMonitor::stop_requested() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return stop_;
}

void HealthMonitor::update_settings(HealthSettings s) noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    settings_ = s;
}

HealthSettings HealthMonitor::settings() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return settings_;
}

uint64_t HealthMonitor::cycles() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return cycles_;
}

bool HealthMonitor::sleep_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(mu_);
    return !wake_.wait_for(lk, d, [&] { return stop_; });
}

} // namespace tipguard::health
