/**
 * @file bounded_subpartition.hpp
 * @brief Subpartition spilled completely to disk before it is consumed.
 *
 * The producer writes every unit into a BoundedStore and calls Finish().
 * Afterwards any number of independent views replay the file, each through
 * its own BoundedReader and segment pool. The view is the reader's
 * availability listener, so recycling a staged buffer wakes the consumer.
 */

#ifndef SHUFFLE_BOUNDED_SUBPARTITION_HPP_
#define SHUFFLE_BOUNDED_SUBPARTITION_HPP_

#include "shuffle/availability.hpp"
#include "shuffle/bounded_store.hpp"
#include "shuffle/buffer.hpp"
#include "shuffle/log.hpp"
#include "shuffle/partition_data.hpp"
#include "shuffle/raw_message.hpp"
#include "shuffle/subpartition_view.hpp"
#include "shuffle/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <mutex>

namespace shuffle {

// ============================================================================
// BoundedSubpartitionView
// ============================================================================

class BoundedSubpartitionView final : public SubpartitionView {
 public:
  ~BoundedSubpartitionView() override { ReleaseAllResources(); }

  NextResult GetNextRawMessage() override {
    std::lock_guard<std::mutex> lock(poll_mutex_);
    if (IsReleased()) {
      return NextResult::error(ShuffleError::kReleased);
    }

    auto polled = reader_->NextUnit();
    if (!polled.has_value()) {
      ShuffleError err = polled.get_error();
      SetFailureCause(err);
      SHUFFLE_LOG_ERROR("BoundedView", "subpartition %d: read failed: %s",
                        index_, ShuffleErrorToString(err));
      return NextResult::error(err);
    }
    if (polled.value().IsNotYetAvailable()) {
      return NextResult::success(PollResult<RawMessagePtr>::NotYetAvailable());
    }
    if (polled.value().IsFinished()) {
      PublishCounters();
      return NextResult::success(PollResult<RawMessagePtr>::Finished());
    }

    PartitionDataUnitPtr unit = polled.value().Take();
    PublishCounters();

    // The end of the file still has to be observed by one more poll; it
    // counts as an event so it needs no credit.
    const DataType next = unit->NextDataType();
    const bool can_read = reader_->HasFreeSegment();
    const bool data_available = can_read;
    const bool event_available =
        can_read && (next == DataType::kNone || IsEventType(next));

    auto raw = unit->IntoRawMessage(data_available, event_available);
    if (!raw.has_value()) {
      SetFailureCause(raw.get_error());
      return NextResult::error(raw.get_error());
    }
    return NextResult::success(
        PollResult<RawMessagePtr>::Ready(std::move(raw.value())));
  }

  bool IsAvailable(int32_t credits) override {
    std::lock_guard<std::mutex> lock(poll_mutex_);
    if (IsReleased() || reader_->IsFinished() || reader_->IsClosed()) {
      return false;
    }
    if (!reader_->HasFreeSegment()) {
      return false;
    }
    const DataType next = reader_->PeekNextDataType();
    if (next == DataType::kNone) {
      // End of data, or a header error that the next poll will report.
      return true;
    }
    return (credits > 0) || IsEventType(next);
  }

  /// Bounded subpartitions never pause, so there is nothing to resume.
  void ResumeConsumption() override {}

  void ReleaseAllResources() override {
    if (!MarkReleased()) {
      return;
    }
    std::lock_guard<std::mutex> lock(poll_mutex_);
    if (reader_) {
      reader_->Close();
    }
    SHUFFLE_LOG_DEBUG("BoundedView", "subpartition %d: view released", index_);
  }

  uint32_t UnsynchronizedQueuedUnitCount() const noexcept override {
    return remaining_units_.load(std::memory_order_relaxed);
  }

  int32_t DataBacklog() const noexcept override {
    return data_backlog_.load(std::memory_order_relaxed);
  }

  ReadMode Mode() const noexcept { return reader_->Mode(); }

 private:
  friend class BoundedBlockingSubpartition;

  BoundedSubpartitionView(int32_t index, AvailabilityListener* listener)
      : SubpartitionView(listener), index_(index) {}

  /// Second construction step: the reader needs `this` as its listener.
  expected<void, ShuffleError> Open(BoundedStore& store,
                                    const BoundedReadOptions& options) {
    auto reader = store.CreateReader(options, this);
    if (!reader.has_value()) {
      return expected<void, ShuffleError>::error(reader.get_error());
    }
    reader_ = std::move(reader.value());
    PublishCounters();
    return expected<void, ShuffleError>::success();
  }

  void PublishCounters() noexcept {
    remaining_units_.store(reader_->RemainingUnits(),
                           std::memory_order_relaxed);
    data_backlog_.store(reader_->DataBacklog(), std::memory_order_relaxed);
  }

  const int32_t index_;
  std::mutex poll_mutex_;
  BoundedReaderPtr reader_;
  std::atomic<uint32_t> remaining_units_{0U};
  std::atomic<int32_t> data_backlog_{0};
};

// ============================================================================
// BoundedBlockingSubpartition
// ============================================================================

class BoundedBlockingSubpartition final {
 public:
  ~BoundedBlockingSubpartition() { Release(); }

  BoundedBlockingSubpartition(const BoundedBlockingSubpartition&) = delete;
  BoundedBlockingSubpartition& operator=(const BoundedBlockingSubpartition&) =
      delete;

  /// @brief Create the subpartition with its spill file at @p path.
  static expected<std::unique_ptr<BoundedBlockingSubpartition>, ShuffleError>
  Create(int32_t index, const char* path, const BoundedReadOptions& options) {
    auto store = BoundedStore::Create(path);
    if (!store.has_value()) {
      return expected<std::unique_ptr<BoundedBlockingSubpartition>,
                      ShuffleError>::error(store.get_error());
    }
    return expected<std::unique_ptr<BoundedBlockingSubpartition>,
                    ShuffleError>::success(
        std::unique_ptr<BoundedBlockingSubpartition>(
            new BoundedBlockingSubpartition(index, std::move(store.value()),
                                            options)));
  }

  /// @brief Spill one unit. The buffer may be recycled right afterwards.
  expected<void, ShuffleError> Add(const Buffer& buffer) {
    if (IsReleased()) {
      return expected<void, ShuffleError>::error(ShuffleError::kReleased);
    }
    return store_->WriteUnit(buffer);
  }

  expected<void, ShuffleError> Finish() {
    if (IsReleased()) {
      return expected<void, ShuffleError>::error(ShuffleError::kReleased);
    }
    return store_->FinishWrite();
  }

  /**
   * @brief Open a new independent view over the finished data.
   *
   * The listener is notified once immediately, since a finished
   * subpartition has data (or its end) available right away.
   * @return kNotSealed before Finish(), kReleased after Release().
   */
  expected<SubpartitionViewPtr, ShuffleError> CreateReadView(
      AvailabilityListener* listener) {
    if (IsReleased()) {
      return expected<SubpartitionViewPtr, ShuffleError>::error(
          ShuffleError::kReleased);
    }
    std::unique_ptr<BoundedSubpartitionView> view(
        new BoundedSubpartitionView(index_, listener));
    auto opened = view->Open(*store_, options_);
    if (!opened.has_value()) {
      return expected<SubpartitionViewPtr, ShuffleError>::error(
          opened.get_error());
    }
    view->NotifyDataAvailable();
    SHUFFLE_LOG_DEBUG("Bounded", "subpartition %d: view created (%s)", index_,
                      options_.mode == ReadMode::kBuffer ? "buffer"
                                                         : "file-region");
    return expected<SubpartitionViewPtr, ShuffleError>::success(
        SubpartitionViewPtr(view.release()));
  }

  /**
   * @brief Delete the spill file. Idempotent.
   *
   * Views created earlier fail their next read with kCancelled.
   */
  void Release() noexcept {
    if (released_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    store_->Close();
    SHUFFLE_LOG_DEBUG("Bounded", "subpartition %d released", index_);
  }

  int32_t Index() const noexcept { return index_; }
  bool IsFinished() const noexcept { return store_->IsSealed(); }
  bool IsReleased() const noexcept {
    return released_.load(std::memory_order_acquire);
  }
  const BoundedStore& Store() const noexcept { return *store_; }
  const BoundedReadOptions& ReadOptions() const noexcept { return options_; }

 private:
  BoundedBlockingSubpartition(int32_t index, BoundedStorePtr store,
                              const BoundedReadOptions& options)
      : index_(index), store_(std::move(store)), options_(options) {}

  const int32_t index_;
  BoundedStorePtr store_;
  const BoundedReadOptions options_;
  std::atomic<bool> released_{false};
};

}  // namespace shuffle

#endif  // SHUFFLE_BOUNDED_SUBPARTITION_HPP_
