/**
 * @file subpartition_view.hpp
 * @brief Per-consumer cursor over one subpartition.
 *
 * A view turns the units of a subpartition (memory queue or spill file)
 * into a lazy sequence of RawMessages for the single poll thread that owns
 * it. Everything else talks to the view only through NotifyDataAvailable()
 * and ReleaseAllResources(), both of which are thread-safe and idempotent.
 *
 * Notification is message passing: NotifyDataAvailable() raises a
 * single-slot flag and forwards the signal to the listener registered at
 * creation. It never calls back into the poll path.
 */

#ifndef SHUFFLE_SUBPARTITION_VIEW_HPP_
#define SHUFFLE_SUBPARTITION_VIEW_HPP_

#include "shuffle/availability.hpp"
#include "shuffle/raw_message.hpp"
#include "shuffle/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>

namespace shuffle {

class SubpartitionView : public AvailabilityListener {
 public:
  using NextResult = expected<PollResult<RawMessagePtr>, ShuffleError>;

  ~SubpartitionView() override = default;

  SubpartitionView(const SubpartitionView&) = delete;
  SubpartitionView& operator=(const SubpartitionView&) = delete;

  // --------------------------------------------------------------------------
  // Poll side (single thread at a time)
  // --------------------------------------------------------------------------

  /**
   * @brief Produce the next message snapshot.
   *
   * Ready(msg), NotYetAvailable() (retry after a notification) or
   * Finished() (end of stream). A fatal error is also recorded as the
   * failure cause. Fails with kReleased after ReleaseAllResources().
   */
  virtual NextResult GetNextRawMessage() = 0;

  /**
   * @brief Whether GetNextRawMessage() would make progress.
   *
   * With credits > 0 any queued unit counts; with 0 credits only an event
   * (or the end of the stream) counts.
   */
  virtual bool IsAvailable(int32_t credits) = 0;

  /// @brief Clear a paused state (e.g. after an aligned barrier).
  virtual void ResumeConsumption() = 0;

  // --------------------------------------------------------------------------
  // Any thread
  // --------------------------------------------------------------------------

  /// @brief Free the view's resources. Idempotent and thread-safe.
  virtual void ReleaseAllResources() = 0;

  bool IsReleased() const noexcept {
    return released_.load(std::memory_order_acquire);
  }

  /// @brief Advisory count of units not yet handed out.
  virtual uint32_t UnsynchronizedQueuedUnitCount() const noexcept = 0;

  /// @brief Advisory count of data units not yet handed out.
  virtual int32_t DataBacklog() const noexcept = 0;

  void NotifyDataAvailable() noexcept override {
    if (IsReleased()) {
      return;
    }
    (void)notification_.Raise();
    if (listener_ != nullptr) {
      listener_->NotifyDataAvailable();
    }
  }

  /// @brief Consume a pending notification, if any.
  bool TakeNotification() noexcept { return notification_.Take(); }

  uint32_t NotificationCount() const noexcept {
    return notification_.RaiseCount();
  }

  optional<ShuffleError> GetFailureCause() const noexcept {
    int32_t cause = failure_cause_.load(std::memory_order_acquire);
    if (cause < 0) {
      return optional<ShuffleError>();
    }
    return optional<ShuffleError>(static_cast<ShuffleError>(cause));
  }

 protected:
  /// @param listener Must outlive the view. May be null.
  explicit SubpartitionView(AvailabilityListener* listener) noexcept
      : listener_(listener) {}

  /// @return true for the call that actually released the view.
  bool MarkReleased() noexcept {
    return !released_.exchange(true, std::memory_order_acq_rel);
  }

  /// @brief Record the first fatal error; later ones are ignored.
  void SetFailureCause(ShuffleError err) noexcept {
    int32_t expected_none = -1;
    (void)failure_cause_.compare_exchange_strong(
        expected_none, static_cast<int32_t>(err), std::memory_order_acq_rel);
  }

 private:
  AvailabilityListener* const listener_;
  NotificationFlag notification_;
  std::atomic<bool> released_{false};
  std::atomic<int32_t> failure_cause_{-1};
};

using SubpartitionViewPtr = std::unique_ptr<SubpartitionView>;

}  // namespace shuffle

#endif  // SHUFFLE_SUBPARTITION_VIEW_HPP_
