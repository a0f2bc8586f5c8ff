/**
* @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "tipguard/obs/observability.hpp"
#include <mutex>
#include <spdlog/spdlog.h>

namespace tipguard::obs {

    class LogObserver : public Observer {
    public:
        void record(const HealthEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                bump(e.kind);
            }
            switch (e.kind) {
                case EventKind::Demoted:
                    if (e.responsive) {
                        spdlog::warn("{} is falling behind (head {}, agreed {}). Removed from active pool.",
                                     e.url, e.reported_head, e.agreed_head);
                    } else {
                        spdlog::warn("{} did not report a head. Removed from active pool.", e.url);
                    }
                    break;
                case EventKind::Promoted:
                    spdlog::info("{} is following the head again (head {}). Added to active pool.",
                                 e.url, e.reported_head);
                    break;
                case EventKind::Dropped:
                    spdlog::warn("WS connection #{} ({}) dropped. Moved to poverty pool.", e.index, e.url);
                    break;
                case EventKind::MigrationFailed:
                    spdlog::warn("Could not move subscriptions away from WS connection #{}.", e.index);
                    break;
                case EventKind::CycleCompleted:
                    spdlog::info("Health check OK: agreed head {}, {} active, {} in poverty.",
                                 e.agreed_head, e.active_size, e.poverty_size);
                    break;
            }
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        void bump(EventKind k) noexcept {
            switch (k) {
                case EventKind::Demoted:         ctr_.demotions++; break;
                case EventKind::Promoted:        ctr_.promotions++; break;
                case EventKind::Dropped:         ctr_.drops++; break;
                case EventKind::MigrationFailed: ctr_.failed_migrations++; break;
                case EventKind::CycleCompleted:  ctr_.cycles++; break;
            }
        }
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_log_observer() {
        static LogObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace tipguard::obs
