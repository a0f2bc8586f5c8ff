/**
 * @file channel.hpp
 * @brief Multi-producer/single-consumer FIFO channel with blocking receive.
 *
 * Design goals:
 *  - Fan-in of per-node poll results (bounded, sized to the pool).
 *  - Event streams between long-running loops (transport failures, reconnect
 *    requests).
 *  - try_send never blocks: callers on best-effort paths can send-or-drop.
 *  - close() wakes every waiter; receivers drain queued values first.
 *
 * Construction:
 *  - Channel<T>::with_capacity(n) validates n and returns a shared channel.
 *  - Channel<T>::unbounded() for event streams that must never drop.
 *
 * @tparam T Element type. Must be nothrow-movable.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include "tipguard/compat/expected.hpp"  // tipguard_detail::expected / unexpected

namespace tipguard::mem {

/**
 * @brief Error codes reported by the factory (setup time only).
 */
enum class ChannelError : std::uint8_t {
  CapacityZero = 1,          ///< Capacity must not be zero
  ElementNotNothrowMovable   ///< T must be nothrow-movable
};

/**
 * @brief Outcome of a receive.
 */
enum class RecvStatus : std::uint8_t {
  Value,    ///< A value was written to the output
  Timeout,  ///< Deadline passed with nothing queued
  Closed    ///< Channel closed and drained
};

/**
 * @brief MPSC channel shared through std::shared_ptr.
 *
 * @tparam T Element type.
 */
template <class T>
class Channel final {
public:
  using value_type = T;
  using clock      = std::chrono::steady_clock;

  /// Capacity value used by unbounded channels.
  static constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

  /**
   * @brief Factory: validates the capacity (no exceptions on bad input).
   * @param capacity Maximum number of queued values (> 0).
   * @return expected<shared_ptr<Channel>, ChannelError>.
   */
  static tipguard_detail::expected<std::shared_ptr<Channel>, ChannelError>
  with_capacity(std::size_t capacity) {
    if (capacity == 0) {
      return tipguard_detail::unexpected(ChannelError::CapacityZero);
    }
    if (!std::is_nothrow_move_constructible_v<T>) {
      return tipguard_detail::unexpected(ChannelError::ElementNotNothrowMovable);
    }
    return std::shared_ptr<Channel>(new Channel(capacity));
  }

  /// @brief Channel without a capacity limit; send() never blocks.
  static std::shared_ptr<Channel> unbounded() {
    return std::shared_ptr<Channel>(new Channel(kUnbounded));
  }

  Channel(const Channel&)            = delete; ///< Non-copyable
  Channel& operator=(const Channel&) = delete; ///< Non-assignable

  /**
   * @brief Send, waiting while the channel is full.
   * @return false if the channel is (or becomes) closed.
   */
  bool send(T v) {
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, [&] { return closed_ || q_.size() < capacity_; });
    if (closed_) return false;
    q_.push_back(std::move(v));
    lk.unlock();
    not_empty_.notify_one();
    return true;
  }

  /**
   * @brief Send-or-drop. Never blocks.
   * @return false if the channel is full or closed; the value is dropped.
   */
  bool try_send(T v) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_ || q_.size() >= capacity_) return false;
      q_.push_back(std::move(v));
    }
    not_empty_.notify_one();
    return true;
  }

  /**
   * @brief Block until a value arrives or the channel is closed and drained.
   * @param out Destination for the received value.
   */
  RecvStatus recv(T& out) {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, [&] { return closed_ || !q_.empty(); });
    return take(lk, out);
  }

  /**
   * @brief Like recv(), but gives up at @p deadline.
   */
  RecvStatus recv_until(T& out, clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!not_empty_.wait_until(lk, deadline, [&] { return closed_ || !q_.empty(); })) {
      return RecvStatus::Timeout;
    }
    return take(lk, out);
  }

  /// @brief Close the channel and wake all waiters. Idempotent.
  void close() noexcept {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  /// @brief True once close() was called (values may still be queued).
  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  /// @brief Number of queued values (snapshot).
  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

  /// @brief Configured capacity (kUnbounded for unbounded channels).
  std::size_t capacity() const noexcept { return capacity_; }

private:
  explicit Channel(std::size_t capacity) noexcept : capacity_(capacity) {}

  // Caller holds mu_ and the wait predicate is satisfied.
  RecvStatus take(std::unique_lock<std::mutex>& lk, T& out) {
    if (q_.empty()) return RecvStatus::Closed; // closed and drained
    out = std::move(q_.front());
    q_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return RecvStatus::Value;
  }

  const std::size_t       capacity_;         ///< Max queued values
  mutable std::mutex      mu_;               ///< Guards q_ and closed_
  std::condition_variable not_empty_;        ///< Signalled on push/close
  std::condition_variable not_full_;         ///< Signalled on pop/close
  std::deque<T>           q_;                ///< Queued values (FIFO)
  bool                    closed_{false};    ///< Set once by close()
};

} // namespace tipguard::mem
