#pragma once
/**
 * @file sim_node_client.hpp
 * @brief Scripted NodeClient for tests, demos and dry runs.
 * @details Thread-safe: the poller calls block_number() from worker threads
 *          while the owner rewrites the script.
 */

#include "tipguard/health/node_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace tipguard::health {

    /**
     * @class SimulatedNodeClient
     * @brief Reports a configurable head, failure or latency.
     */
    class SimulatedNodeClient final : public NodeClient {
    public:
        explicit SimulatedNodeClient(BlockNumber head = 0) noexcept : head_(head) {}

        tipguard_detail::expected<BlockNumber, FetchError>
        block_number(std::chrono::milliseconds timeout) override;

        /// Report @p h from now on.
        void set_head(BlockNumber h) noexcept { head_.store(h, std::memory_order_relaxed); }

        /// Move the head forward, e.g. one block per cycle.
        void advance(BlockNumber by = 1) noexcept { head_.fetch_add(by, std::memory_order_relaxed); }

        /// Fail every call with @p e until recover().
        void fail_with(FetchError e) noexcept;

        /// Clear a failure set by fail_with().
        void recover() noexcept;

        /// Sleep this long before answering. Longer than the caller's timeout
        /// emulates a hung node (the call does not give up early).
        void set_latency(std::chrono::milliseconds l) noexcept {
            latency_ms_.store(static_cast<std::uint64_t>(l.count()), std::memory_order_relaxed);
        }

        /// Answer with a raw JSON-RPC body decoded by parse_block_number_response().
        void set_raw_response(std::string body);

        /// Number of block_number() calls served.
        std::uint64_t calls() const noexcept { return calls_.load(std::memory_order_relaxed); }

    private:
        std::atomic<BlockNumber>   head_;
        std::atomic<std::uint8_t>  failure_{0};       ///< 0 = healthy, else FetchError value
        std::atomic<std::uint64_t> latency_ms_{0};
        std::atomic<std::uint64_t> calls_{0};

        mutable std::mutex         raw_mu_;
        std::optional<std::string> raw_;              ///< Guarded by raw_mu_
    };

} // namespace tipguard::health
