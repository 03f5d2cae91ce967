/**
 * @file availability.hpp
 * @brief "Data became available" signalling between threads.
 *
 * Producers, recycle callbacks and readers never call into the consumer's
 * poll loop directly. They raise a NotificationFlag (a single-slot mailbox)
 * through an AvailabilityListener; the poll thread takes the flag and polls
 * again. Any number of raises before a take collapse into one wake-up.
 */

#ifndef SHUFFLE_AVAILABILITY_HPP_
#define SHUFFLE_AVAILABILITY_HPP_

#include "shuffle/platform.hpp"

#include <cstdint>

#include <atomic>

namespace shuffle {

// ============================================================================
// AvailabilityListener
// ============================================================================

/**
 * @brief Receives "more data may be available" signals.
 *
 * NotifyDataAvailable() may be invoked on any thread, possibly while the
 * caller holds internal locks, so implementations must only set flags and
 * must not call back into the notifier.
 */
class AvailabilityListener {
 public:
  virtual ~AvailabilityListener() = default;
  virtual void NotifyDataAvailable() noexcept = 0;
};

// ============================================================================
// NotificationFlag
// ============================================================================

class NotificationFlag final {
 public:
  /// @brief Raise the flag.
  /// @return true if it was lowered before (the raise is a new wake-up).
  bool Raise() noexcept {
    raise_count_.fetch_add(1U, std::memory_order_relaxed);
    return !raised_.exchange(true, std::memory_order_acq_rel);
  }

  /// @brief Lower the flag.
  /// @return true if it was raised.
  bool Take() noexcept {
    return raised_.exchange(false, std::memory_order_acq_rel);
  }

  bool IsRaised() const noexcept {
    return raised_.load(std::memory_order_acquire);
  }

  /// @brief Total raises since construction (diagnostics).
  uint32_t RaiseCount() const noexcept {
    return raise_count_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<bool> raised_{false};
  std::atomic<uint32_t> raise_count_{0U};
};

/// @brief Listener that only records the signal. Used by tests and demos.
class FlagListener final : public AvailabilityListener {
 public:
  void NotifyDataAvailable() noexcept override { (void)flag_.Raise(); }

  NotificationFlag& Flag() noexcept { return flag_; }
  uint32_t NotifyCount() const noexcept { return flag_.RaiseCount(); }

 private:
  NotificationFlag flag_;
};

}  // namespace shuffle

#endif  // SHUFFLE_AVAILABILITY_HPP_
