#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade for the health core: health events + counters.
 * @details The default sink logs through spdlog; tests plug in recorders.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace tipguard::obs {

    /** @struct Counters
     *  @brief Process-level counters for health decisions.
     */
    struct Counters {
        uint64_t cycles{0};             ///< Completed health cycles
        uint64_t demotions{0};          ///< Nodes moved active → poverty by arbitration
        uint64_t promotions{0};         ///< Nodes moved poverty → active
        uint64_t drops{0};              ///< Transport failures handled
        uint64_t failed_migrations{0};  ///< Subscription migrations that reported failure
    };

    /** @enum EventKind
     *  @brief What happened to a node (or to the cycle).
     */
    enum class EventKind : uint8_t {
        Demoted,          ///< Fell behind the agreed head or did not answer
        Promoted,         ///< Caught up with the agreed head
        Dropped,          ///< Node quarantined after a WS transport failure
        MigrationFailed,  ///< move_subscriptions reported failure (swallowed)
        CycleCompleted    ///< One full demotion + promotion pass finished
    };

    /** @struct HealthEvent
     *  @brief Payload describing a single health decision.
     */
    struct HealthEvent {
        EventKind   kind{EventKind::CycleCompleted}; ///< Event type
        uint64_t    node_id{0};          ///< Affected node (0 for cycle events)
        std::string url;                 ///< Affected endpoint
        bool        responsive{true};    ///< False if the node gave no head
        uint64_t    reported_head{0};    ///< Head the node reported (if responsive)
        uint64_t    agreed_head{0};      ///< Reference head of the pass
        std::size_t index{0};            ///< Active-pool index (drop events)
        std::size_t active_size{0};      ///< Pool sizes after the event
        std::size_t poverty_size{0};
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single health event.
        virtual void record(const HealthEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide spdlog-backed observer.
    Observer* make_log_observer();

} // namespace tipguard::obs
