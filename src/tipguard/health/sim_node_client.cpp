/**
* @file sim_node_client.cpp
 * @brief Implementation of the scripted node client.
 */
#include "tipguard/health/sim_node_client.hpp"

#include <thread>
#include <utility>

namespace tipguard::health {

    tipguard_detail::expected<BlockNumber, FetchError>
    SimulatedNodeClient::block_number(std::chrono::milliseconds) {
        calls_.fetch_add(1, std::memory_order_relaxed);

        const auto latency = latency_ms_.load(std::memory_order_relaxed);
        if (latency) std::this_thread::sleep_for(std::chrono::milliseconds(latency));

        if (const auto f = failure_.load(std::memory_order_relaxed)) {
            return tipguard_detail::unexpected(static_cast<FetchError>(f));
        }

        {
            std::lock_guard<std::mutex> lk(raw_mu_);
            if (raw_) return parse_block_number_response(*raw_);
        }
        return head_.load(std::memory_order_relaxed);
    }

    void SimulatedNodeClient::fail_with(FetchError e) noexcept {
        failure_.store(static_cast<std::uint8_t>(e), std::memory_order_relaxed);
    }

    void SimulatedNodeClient::recover() noexcept {
        failure_.store(0, std::memory_order_relaxed);
    }

    void SimulatedNodeClient::set_raw_response(std::string body) {
        std::lock_guard<std::mutex> lk(raw_mu_);
        raw_ = std::move(body);
    }

} // namespace tipguard::health
