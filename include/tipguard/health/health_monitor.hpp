#pragma once
/**
 * @file health_monitor.hpp
 * @brief The health loop: sleep, demote, promote, refresh the safe block.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "tipguard/compat/expected.hpp"
#include "tipguard/config/constants.hpp"
#include "tipguard/health/collaborators.hpp"
#include "tipguard/health/error.hpp"
#include "tipguard/health/node.hpp"
#include "tipguard/health/node_registry.hpp"
#include "tipguard/obs/observability.hpp"

namespace tipguard::health {

/** @struct HealthSettings
 *  @brief Cadence of the health loop.
 */
struct HealthSettings {
    std::chrono::milliseconds interval{config::constants::HEALTH_CHECK_INTERVAL_MS}; ///< Sleep between cycles; also the refresh budget
    std::chrono::milliseconds ttl{config::constants::HEAD_QUERY_TTL_MS};             ///< Per-node head query deadline
};

/** @class HealthMonitor
 *  @brief Runs one health cycle per interval until stopped or a fatal error.
 *
 *  Cycle: poll active → make_poverty → poll poverty → escape_poverty →
 *  SafeBlockRefresher::refresh(interval). The poverty pass always uses the
 *  agreed head of the active pass of the same cycle.
 */
class HealthMonitor {
public:
    HealthMonitor(NodeRegistry& registry, SafeBlockRefresher& refresher,
                  HealthSettings settings = {},
                  obs::Observer& obs = *obs::make_log_observer()) noexcept
        : registry_(registry), refresher_(refresher), obs_(obs), settings_(settings) {}

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * @brief Loop forever. Returns the first fatal error, or success once
     *        request_stop() was called.
     */
    tipguard_detail::expected<void, HealthError> run();

    /// One full cycle without the leading sleep. Returns the agreed head.
    tipguard_detail::expected<BlockNumber, HealthError> run_cycle();

    /// Wake the loop and make run() return after the current cycle.
    void request_stop() noexcept;

    [[nodiscard]] bool stop_requested() const noexcept;

    /// Settings are re-read at the start of every cycle.
    void update_settings(HealthSettings s) noexcept;
    [[nodiscard]] HealthSettings settings() const noexcept;

    /// Completed cycles since construction.
    [[nodiscard]] uint64_t cycles() const noexcept;

private:
    /// Sleep for @p d; false if a stop was requested meanwhile.
    bool sleep_for(std::chrono::milliseconds d);

    NodeRegistry&       registry_;
    SafeBlockRefresher& refresher_;
    obs::Observer&      obs_;

    mutable std::mutex      mu_;          ///< Guards settings_, stop_, cycles_
    std::condition_variable wake_;
    HealthSettings          settings_;
    bool                    stop_{false};
    uint64_t                cycles_{0};
};

} // namespace tipguard::health
