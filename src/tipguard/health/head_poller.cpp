/**
 * @file head_poller.cpp
 * @brief Fan-out of per-node fetches, fan-in through a bounded Channel.
 */
#include "tipguard/health/head_poller.hpp"
#include "tipguard/health/node_client.hpp"
#include "tipguard/mem/channel.hpp"
#include "tipguard/config/constants.hpp"

#include <algorithm>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace tipguard::health {

using tipguard::mem::Channel;
using tipguard::mem::RecvStatus;

namespace {

/// Clients with a fetch still running. A client that ignores its timeout
/// keeps its slot until the call returns; later polls skip it meanwhile.
class InFlight {
public:
    bool try_acquire(const NodeClient* c) {
        std::lock_guard<std::mutex> lk(mu_);
        return busy_.insert(c).second;
    }
    void release(const NodeClient* c) noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        busy_.erase(c);
    }
    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return busy_.size();
    }

private:
    mutable std::mutex                      mu_;
    std::unordered_set<const NodeClient*>   busy_;
};

InFlight& in_flight() {
    static InFlight registry;
    return registry;
}

/// Releases the client's slot when the fetch task ends.
class InFlightSlot {
public:
    explicit InFlightSlot(const NodeClient* c) noexcept : c_(c) {}
    ~InFlightSlot() { in_flight().release(c_); }
    InFlightSlot(const InFlightSlot&) = delete;
    InFlightSlot& operator=(const InFlightSlot&) = delete;

private:
    const NodeClient* c_;
};

} // namespace

std::size_t fetches_in_flight() {
    return in_flight().size();
}

tipguard_detail::expected<HeadResults, HealthError>
poll_heads(const NodeList& pool, std::chrono::milliseconds timeout) {
    HeadResults out;
    if (pool.empty()) return out;

    // Sized to the pool: every task can deliver without blocking, and a task
    // that finishes after we stop listening finds the channel closed.
    const auto cap = std::max<std::size_t>(pool.size(), config::constants::POLLER_MIN_FANIN_CAPACITY);
    auto ch_exp = Channel<HeadResult>::with_capacity(cap);
    if (!ch_exp) return tipguard_detail::unexpected(HealthError::ChannelClosed);
    auto ch = std::move(*ch_exp);

    out.reserve(pool.size());
    for (std::size_t i = 0; i < pool.size(); ++i) {
        out.push_back(HeadResult::unresponsive(i, pool[i].id));
    }

    const auto deadline = Channel<HeadResult>::clock::now() + timeout;
    for (std::size_t i = 0; i < pool.size(); ++i) {
        if (!pool[i].client) {
            out[i].error = FetchError::Transport;
            if (!ch->try_send(out[i])) return tipguard_detail::unexpected(HealthError::ChannelClosed);
            continue;
        }
        const NodeClient* key = pool[i].client.get();
        if (!in_flight().try_acquire(key)) {
            // Previous fetch has not returned yet: report, do not pile up.
            spdlog::debug("head poll: {} still busy with an earlier fetch", pool[i].url);
            if (!ch->try_send(out[i])) return tipguard_detail::unexpected(HealthError::ChannelClosed);
            continue;
        }
        try {
            // The task owns a copy of the handle (and so the client) for as long as it runs.
            std::thread([ch, node = pool[i], i, timeout] {
                auto r = [&] {
                    // Freed before delivery, so the next poll never sees a finished fetch as busy.
                    InFlightSlot slot(node.client.get());
                    return node.client->block_number(timeout);
                }();
                (void)ch->try_send(r ? HeadResult::reported(i, node.id, *r)
                                     : HeadResult::unresponsive(i, node.id, r.error()));
            }).detach();
        } catch (const std::system_error& e) {
            in_flight().release(key);
            spdlog::error("head poll: could not start task for {}: {}", pool[i].url, e.what());
            out[i].error = FetchError::Transport;
            if (!ch->try_send(out[i])) return tipguard_detail::unexpected(HealthError::ChannelClosed);
        }
    }

    std::vector<bool> seen(pool.size(), false);
    std::size_t received = 0;
    bool timed_out = false;
    while (received < pool.size() && !timed_out) {
        HeadResult r;
        switch (ch->recv_until(r, deadline)) {
            case RecvStatus::Value:
                if (r.index < out.size() && !seen[r.index]) {
                    seen[r.index] = true;
                    out[r.index] = r;
                    ++received;
                }
                break;
            case RecvStatus::Timeout:
                timed_out = true;
                break;
            case RecvStatus::Closed:
                return tipguard_detail::unexpected(HealthError::ChannelClosed);
        }
    }
    ch->close(); // late tasks drop their result

    for (const auto& r : out) {
        if (!r.responsive()) {
            spdlog::debug("head poll: {} unresponsive ({})", pool[r.index].url, to_string(r.error.value_or(FetchError::Timeout)));
        }
    }
    return out;
}

} // namespace tipguard::health
