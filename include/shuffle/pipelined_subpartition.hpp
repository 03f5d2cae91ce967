/**
 * @file pipelined_subpartition.hpp
 * @brief Memory-resident subpartition consumed while it is being produced.
 *
 * The producer thread Add()s buffers into a lock-free SPSC ring; the single
 * read view drains it on the poll thread. Whenever the view runs out of
 * work it arms a wake-up request; the next Add() after that notifies it.
 * Events and Finish() always notify.
 *
 * An aligned barrier blocks the view after it is handed out: nothing more
 * is produced until ResumeConsumption().
 *
 * Lifetime: the subpartition must outlive its view.
 */

#ifndef SHUFFLE_PIPELINED_SUBPARTITION_HPP_
#define SHUFFLE_PIPELINED_SUBPARTITION_HPP_

#include "shuffle/availability.hpp"
#include "shuffle/buffer.hpp"
#include "shuffle/log.hpp"
#include "shuffle/raw_message.hpp"
#include "shuffle/spsc_ringbuffer.hpp"
#include "shuffle/subpartition_view.hpp"
#include "shuffle/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <mutex>

#ifndef SHUFFLE_PIPELINED_QUEUE_DEPTH
#define SHUFFLE_PIPELINED_QUEUE_DEPTH 64U
#endif

namespace shuffle {

class PipelinedSubpartitionView;

// ============================================================================
// PipelinedSubpartition
// ============================================================================

class PipelinedSubpartition final {
 public:
  using Queue = SpscRingbuffer<Buffer, SHUFFLE_PIPELINED_QUEUE_DEPTH>;

  explicit PipelinedSubpartition(int32_t index) noexcept : index_(index) {}

  ~PipelinedSubpartition() { Release(); }

  PipelinedSubpartition(const PipelinedSubpartition&) = delete;
  PipelinedSubpartition& operator=(const PipelinedSubpartition&) = delete;

  // --------------------------------------------------------------------------
  // Producer side (single thread)
  // --------------------------------------------------------------------------

  /**
   * @brief Enqueue a buffer.
   *
   * On failure @p buffer is left untouched: kQueueFull when the ring is
   * full (retry later), kSealed after Finish(), kReleased after Release().
   */
  expected<void, ShuffleError> Add(Buffer&& buffer);

  /// @brief Mark the end of data. The view reports Finished once drained.
  expected<void, ShuffleError> Finish();

  // --------------------------------------------------------------------------
  // Consumer side
  // --------------------------------------------------------------------------

  /**
   * @brief Create the one read view of this subpartition.
   * @param listener Receives the view's availability signals. May be null.
   * @return kIllegalState if a view was already created, kReleased after
   *         Release().
   */
  expected<SubpartitionViewPtr, ShuffleError> CreateReadView(
      AvailabilityListener* listener);

  /// @brief Drop all queued buffers and fail the view. Idempotent.
  void Release();

  int32_t Index() const noexcept { return index_; }
  bool IsFinished() const noexcept {
    return finished_.load(std::memory_order_acquire);
  }
  bool IsReleased() const noexcept {
    return released_.load(std::memory_order_acquire);
  }
  uint32_t QueuedBuffers() const noexcept {
    return static_cast<uint32_t>(queue_.Size());
  }
  int32_t DataBacklog() const noexcept {
    return data_backlog_.load(std::memory_order_relaxed);
  }

 private:
  friend class PipelinedSubpartitionView;

  void NotifyView() {
    std::lock_guard<std::mutex> lock(consumer_mutex_);
    if (view_ != nullptr) {
      view_->NotifyDataAvailable();
    }
  }

  /**
   * Request a notification from the next Add(). Caller holds
   * consumer_mutex_.
   * @return true if a buffer was published before the request was seen,
   *         so the caller must look at the queue again.
   */
  bool ArmWakeUpLocked() noexcept {
    wake_up_requested_.store(true, std::memory_order_relaxed);
    // Pairs with the fence in Add(): either Add() sees the request or the
    // queue check below sees the buffer.
    std::atomic_thread_fence(std::memory_order_seq_cst);
    return !queue_.IsEmpty();
  }

  /// Drop every queued buffer. Caller holds consumer_mutex_.
  void DrainLocked() noexcept {
    Buffer dropped;
    while (queue_.Pop(dropped)) {
    }
    data_backlog_.store(0, std::memory_order_relaxed);
  }

  const int32_t index_;
  Queue queue_;
  std::atomic<int32_t> data_backlog_{0};
  std::atomic<bool> finished_{false};
  std::atomic<bool> released_{false};
  std::atomic<bool> wake_up_requested_{true};

  // Serializes the consumer side of queue_ and guards view_.
  std::mutex consumer_mutex_;
  SubpartitionView* view_ = nullptr;
  bool view_created_ = false;
};

// ============================================================================
// PipelinedSubpartitionView
// ============================================================================

class PipelinedSubpartitionView final : public SubpartitionView {
 public:
  PipelinedSubpartitionView(PipelinedSubpartition* parent,
                            AvailabilityListener* listener) noexcept
      : SubpartitionView(listener), parent_(parent) {}

  ~PipelinedSubpartitionView() override { ReleaseAllResources(); }

  NextResult GetNextRawMessage() override {
    std::lock_guard<std::mutex> lock(parent_->consumer_mutex_);
    if (IsReleased() || parent_->IsReleased()) {
      return NextResult::error(ShuffleError::kReleased);
    }
    if (blocked_.load(std::memory_order_acquire)) {
      return NextResult::success(PollResult<RawMessagePtr>::NotYetAvailable());
    }

    Buffer buffer;
    if (!parent_->queue_.Pop(buffer)) {
      if (!parent_->IsFinished()) {
        if (!parent_->ArmWakeUpLocked() || !parent_->queue_.Pop(buffer)) {
          return NextResult::success(
              PollResult<RawMessagePtr>::NotYetAvailable());
        }
      } else if (!parent_->queue_.Pop(buffer)) {
        // Finish() follows the last Add(), so the second look is final.
        end_reported_ = true;
        return NextResult::success(PollResult<RawMessagePtr>::Finished());
      }
    }
    if (buffer.IsBuffer()) {
      parent_->data_backlog_.fetch_sub(1, std::memory_order_relaxed);
    }
    if (IsBlockingUpstream(buffer.GetDataType())) {
      blocked_.store(true, std::memory_order_release);
    }

    bool data_available = false;
    bool event_available = false;
    ComputeAvailability(&data_available, &event_available);

    return NextResult::success(PollResult<RawMessagePtr>::Ready(
        RawMessagePtr(new BufferRawMessage(std::move(buffer), data_available,
                                           event_available,
                                           parent_->DataBacklog()))));
  }

  bool IsAvailable(int32_t credits) override {
    std::lock_guard<std::mutex> lock(parent_->consumer_mutex_);
    if (IsReleased() || parent_->IsReleased() || end_reported_) {
      return false;
    }
    bool data_available = false;
    bool event_available = false;
    ComputeAvailability(&data_available, &event_available);
    return (credits > 0) ? data_available : event_available;
  }

  void ResumeConsumption() override {
    std::lock_guard<std::mutex> lock(parent_->consumer_mutex_);
    blocked_.store(false, std::memory_order_release);
    if (parent_->ArmWakeUpLocked() || parent_->IsFinished()) {
      NotifyDataAvailable();
    }
  }

  void ReleaseAllResources() override {
    if (!MarkReleased()) {
      return;
    }
    std::lock_guard<std::mutex> lock(parent_->consumer_mutex_);
    parent_->DrainLocked();
    parent_->view_ = nullptr;
    SHUFFLE_LOG_DEBUG("PipelinedView", "subpartition %d: view released",
                      parent_->Index());
  }

  uint32_t UnsynchronizedQueuedUnitCount() const noexcept override {
    return parent_->QueuedBuffers();
  }

  int32_t DataBacklog() const noexcept override {
    return parent_->DataBacklog();
  }

  bool IsBlocked() const noexcept {
    return blocked_.load(std::memory_order_acquire);
  }

 private:
  /// Caller holds consumer_mutex_. A pending end of stream counts as an
  /// event so it is observed without credits. An empty queue arms the
  /// producer's wake-up.
  void ComputeAvailability(bool* data_available,
                           bool* event_available) noexcept {
    if (blocked_.load(std::memory_order_acquire)) {
      return;
    }
    const Buffer* next = parent_->queue_.Peek();
    if (next == nullptr && !parent_->IsFinished() &&
        parent_->ArmWakeUpLocked()) {
      next = parent_->queue_.Peek();
    }
    if (next == nullptr) {
      const bool end_pending = parent_->IsFinished();
      *data_available = end_pending;
      *event_available = end_pending;
      return;
    }
    *data_available = true;
    *event_available = IsEventType(next->GetDataType());
  }

  PipelinedSubpartition* const parent_;
  std::atomic<bool> blocked_{false};
  bool end_reported_ = false;
};

// ============================================================================
// PipelinedSubpartition - out-of-line
// ============================================================================

inline expected<void, ShuffleError> PipelinedSubpartition::Add(
    Buffer&& buffer) {
  if (IsReleased()) {
    return expected<void, ShuffleError>::error(ShuffleError::kReleased);
  }
  if (IsFinished()) {
    return expected<void, ShuffleError>::error(ShuffleError::kSealed);
  }
  if (!buffer.IsValid() || buffer.GetDataType() == DataType::kNone) {
    return expected<void, ShuffleError>::error(ShuffleError::kIllegalState);
  }
  const bool is_data = buffer.IsBuffer();
  // Count before publishing so the consumer never drives the backlog negative.
  if (is_data) {
    data_backlog_.fetch_add(1, std::memory_order_relaxed);
  }
  if (!queue_.Push(std::move(buffer))) {
    if (is_data) {
      data_backlog_.fetch_sub(1, std::memory_order_relaxed);
    }
    return expected<void, ShuffleError>::error(ShuffleError::kQueueFull);
  }
  // Decide after publishing; see ArmWakeUpLocked().
  std::atomic_thread_fence(std::memory_order_seq_cst);
  const bool requested =
      wake_up_requested_.exchange(false, std::memory_order_relaxed);
  if (requested || !is_data) {
    NotifyView();
  }
  return expected<void, ShuffleError>::success();
}

inline expected<void, ShuffleError> PipelinedSubpartition::Finish() {
  if (IsReleased()) {
    return expected<void, ShuffleError>::error(ShuffleError::kReleased);
  }
  if (finished_.exchange(true, std::memory_order_acq_rel)) {
    return expected<void, ShuffleError>::error(ShuffleError::kSealed);
  }
  SHUFFLE_LOG_DEBUG("Pipelined", "subpartition %d finished, %u queued",
                    index_, QueuedBuffers());
  NotifyView();
  return expected<void, ShuffleError>::success();
}

inline expected<SubpartitionViewPtr, ShuffleError>
PipelinedSubpartition::CreateReadView(AvailabilityListener* listener) {
  std::lock_guard<std::mutex> lock(consumer_mutex_);
  if (IsReleased()) {
    return expected<SubpartitionViewPtr, ShuffleError>::error(
        ShuffleError::kReleased);
  }
  if (view_created_) {
    SHUFFLE_LOG_WARN("Pipelined",
                     "subpartition %d can only be consumed once", index_);
    return expected<SubpartitionViewPtr, ShuffleError>::error(
        ShuffleError::kIllegalState);
  }
  auto* view = new PipelinedSubpartitionView(this, listener);
  view_ = view;
  view_created_ = true;
  if (ArmWakeUpLocked() || IsFinished()) {
    view->NotifyDataAvailable();
  }
  return expected<SubpartitionViewPtr, ShuffleError>::success(
      SubpartitionViewPtr(view));
}

inline void PipelinedSubpartition::Release() {
  if (released_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  std::lock_guard<std::mutex> lock(consumer_mutex_);
  DrainLocked();
  if (view_ != nullptr) {
    // Wake the consumer so it observes the release on its next poll.
    view_->NotifyDataAvailable();
  }
  SHUFFLE_LOG_DEBUG("Pipelined", "subpartition %d released", index_);
}

}  // namespace shuffle

#endif  // SHUFFLE_PIPELINED_SUBPARTITION_HPP_
