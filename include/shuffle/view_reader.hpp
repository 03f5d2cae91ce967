/**
 * @file view_reader.hpp
 * @brief Server-side consumer of one subpartition view.
 *
 * Owns the credit count granted by the remote input channel, stamps every
 * outgoing message with the next sequence number and turns RawMessages
 * into wire messages. Data units cost one credit each; events are free.
 *
 * Typical poll loop on the network thread:
 * @code
 *   while (reader.IsAvailable()) {
 *     auto r = reader.GetNextMessage();
 *     if (!r.has_value()) { fail(r.get_error()); break; }
 *     if (!r.value().IsReady()) break;
 *     send(r.value().Take());
 *     if (!reader.IsMoreAvailable()) break;
 *   }
 * @endcode
 * and it is re-entered whenever TakeAvailabilityNotification() is true.
 */

#ifndef SHUFFLE_VIEW_READER_HPP_
#define SHUFFLE_VIEW_READER_HPP_

#include "shuffle/availability.hpp"
#include "shuffle/log.hpp"
#include "shuffle/message.hpp"
#include "shuffle/raw_message.hpp"
#include "shuffle/subpartition_view.hpp"
#include "shuffle/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <utility>

namespace shuffle {

class CreditBasedViewReader final : public AvailabilityListener {
 public:
  using NextResult = expected<PollResult<WireMessage>, ShuffleError>;

  CreditBasedViewReader(const ReceiverId& receiver_id,
                        int32_t initial_credit) noexcept
      : receiver_id_(receiver_id), credits_(initial_credit) {}

  /// The view holds a pointer to this reader, so release it first.
  ~CreditBasedViewReader() override {
    ReleaseAllResources();
    pending_.reset();
    view_.reset();
  }

  CreditBasedViewReader(const CreditBasedViewReader&) = delete;
  CreditBasedViewReader& operator=(const CreditBasedViewReader&) = delete;

  /// @brief Attach the view created with this reader as its listener.
  expected<void, ShuffleError> AttachView(SubpartitionViewPtr view) {
    if (view_ || !view) {
      return expected<void, ShuffleError>::error(ShuffleError::kIllegalState);
    }
    view_ = std::move(view);
    return expected<void, ShuffleError>::success();
  }

  bool HasView() const noexcept { return static_cast<bool>(view_); }

  // --------------------------------------------------------------------------
  // Credits
  // --------------------------------------------------------------------------

  void AddCredit(int32_t credit_delta) noexcept {
    credits_.fetch_add(credit_delta, std::memory_order_acq_rel);
  }

  int32_t NumCredits() const noexcept {
    return credits_.load(std::memory_order_acquire);
  }

  // --------------------------------------------------------------------------
  // Poll side
  // --------------------------------------------------------------------------

  bool IsAvailable() {
    if (!view_) {
      return false;
    }
    if (pending_) {
      return !pending_->IsBuffer() || NumCredits() > 0;
    }
    return view_->IsAvailable(NumCredits());
  }

  /**
   * @brief Produce the next wire message.
   *
   * Sequence numbers start at 0 and grow by one per message handed out.
   * Without credit the view is only polled when an event is next; a data
   * unit that still turns up is held back and handed out once a credit
   * arrives. A message that fails to build is fatal for this reader and
   * is reported by GetFailureCause().
   */
  NextResult GetNextMessage() {
    if (!view_) {
      return NextResult::error(ShuffleError::kIllegalState);
    }
    if (failure_cause_.has_value()) {
      return NextResult::error(failure_cause_.value());
    }
    if (view_->IsReleased()) {
      pending_.reset();
      return NextResult::error(ShuffleError::kReleased);
    }
    if (!pending_) {
      if (NumCredits() <= 0 && !view_->IsAvailable(0)) {
        more_available_ = false;
        return NextResult::success(PollResult<WireMessage>::NotYetAvailable());
      }
      auto polled = view_->GetNextRawMessage();
      if (!polled.has_value()) {
        return NextResult::error(polled.get_error());
      }
      if (polled.value().IsNotYetAvailable()) {
        more_available_ = false;
        return NextResult::success(PollResult<WireMessage>::NotYetAvailable());
      }
      if (polled.value().IsFinished()) {
        more_available_ = false;
        return NextResult::success(PollResult<WireMessage>::Finished());
      }
      pending_ = polled.value().Take();
    }

    const bool is_data = pending_->IsBuffer();
    if (is_data) {
      if (credits_.fetch_sub(1, std::memory_order_acq_rel) <= 0) {
        credits_.fetch_add(1, std::memory_order_acq_rel);
        SHUFFLE_LOG_DEBUG("ViewReader", "data unit %d held until credit",
                          sequence_number_);
        more_available_ = false;
        return NextResult::success(PollResult<WireMessage>::NotYetAvailable());
      }
    }
    RawMessagePtr raw = std::move(pending_);
    more_available_ = raw->IsMoreAvailable(NumCredits());

    auto built = raw->BuildMessage(receiver_id_, sequence_number_);
    if (!built.has_value()) {
      if (is_data) {
        credits_.fetch_add(1, std::memory_order_acq_rel);
      }
      more_available_ = false;
      failure_cause_ = optional<ShuffleError>(built.get_error());
      SHUFFLE_LOG_ERROR("ViewReader", "building message %d failed: %s",
                        sequence_number_,
                        ShuffleErrorToString(built.get_error()));
      return NextResult::error(built.get_error());
    }
    ++sequence_number_;
    return NextResult::success(
        PollResult<WireMessage>::Ready(std::move(built.value())));
  }

  /// @brief Availability snapshot of the last message handed out.
  bool IsMoreAvailable() const noexcept { return more_available_; }

  /// @brief Sequence number the next message will carry.
  int32_t NextSequenceNumber() const noexcept { return sequence_number_; }

  void ResumeConsumption() {
    if (view_) {
      view_->ResumeConsumption();
    }
  }

  // --------------------------------------------------------------------------
  // Any thread
  // --------------------------------------------------------------------------

  void NotifyDataAvailable() noexcept override { (void)notification_.Raise(); }

  /// @brief Consume a pending wake-up, if any.
  bool TakeAvailabilityNotification() noexcept { return notification_.Take(); }

  uint32_t NotificationCount() const noexcept {
    return notification_.RaiseCount();
  }

  void ReleaseAllResources() {
    if (view_) {
      view_->ReleaseAllResources();
    }
  }

  bool IsReleased() const noexcept { return view_ && view_->IsReleased(); }

  /// @brief The view's failure cause, else this reader's own build failure.
  optional<ShuffleError> GetFailureCause() const noexcept {
    if (view_) {
      auto cause = view_->GetFailureCause();
      if (cause.has_value()) {
        return cause;
      }
    }
    return failure_cause_;
  }

  const ReceiverId& GetReceiverId() const noexcept { return receiver_id_; }

 private:
  const ReceiverId receiver_id_;
  std::atomic<int32_t> credits_;
  SubpartitionViewPtr view_;
  RawMessagePtr pending_;
  optional<ShuffleError> failure_cause_;
  int32_t sequence_number_ = 0;
  bool more_available_ = false;
  NotificationFlag notification_;
};

}  // namespace shuffle

#endif  // SHUFFLE_VIEW_READER_HPP_
