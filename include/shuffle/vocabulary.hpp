/**
 * @file vocabulary.hpp
 * @brief Error codes and value types shared by all shuffle components.
 *
 * Provides expected<V, E>, optional<T> and the tri-state PollResult<T> used
 * by every "try to get the next unit" operation. All error reporting in the
 * library goes through these types; nothing throws.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef SHUFFLE_VOCABULARY_HPP_
#define SHUFFLE_VOCABULARY_HPP_

#include "shuffle/platform.hpp"

#include <cstdint>

#include <new>
#include <type_traits>
#include <utility>

namespace shuffle {

// ============================================================================
// Error Codes
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue
};

enum class MemPoolError : uint8_t {
  kPoolExhausted = 0  ///< Every segment is held downstream (backpressure)
};

enum class ShuffleError : uint8_t {
  kIoError = 0,        ///< read/write/fstat syscall failed
  kCorruptedData,      ///< Truncated frame or malformed header
  kFrameTooLarge,      ///< Frame does not fit into the scratch segment
  kSealed,             ///< Write after FinishWrite()/Finish()
  kNotSealed,          ///< Reader requested before the store was sealed
  kClosed,             ///< Operation on a closed store or reader
  kReleased,           ///< View released or unit already consumed
  kIllegalState,       ///< Call not permitted in the current state
  kMissingSegment,     ///< File region materialized without scratch memory
  kRegionNotFlushed,   ///< File region extends beyond the written bytes
  kQueueFull,          ///< Pipelined queue full (producer backpressure)
  kCancelled           ///< Read raced with a concurrent close
};

/// Coarse failure class of a ShuffleError.
enum class ErrorClass : uint8_t {
  kIo = 0,
  kCorruption,
  kPrecondition,
  kBackpressure,
  kCancellation
};

inline ErrorClass ClassifyError(ShuffleError err) noexcept {
  switch (err) {
    case ShuffleError::kIoError:
      return ErrorClass::kIo;
    case ShuffleError::kCorruptedData:
    case ShuffleError::kFrameTooLarge:
      return ErrorClass::kCorruption;
    case ShuffleError::kQueueFull:
      return ErrorClass::kBackpressure;
    case ShuffleError::kCancelled:
      return ErrorClass::kCancellation;
    default:
      return ErrorClass::kPrecondition;
  }
}

inline const char* ShuffleErrorToString(ShuffleError err) noexcept {
  switch (err) {
    case ShuffleError::kIoError:          return "IoError";
    case ShuffleError::kCorruptedData:    return "CorruptedData";
    case ShuffleError::kFrameTooLarge:    return "FrameTooLarge";
    case ShuffleError::kSealed:           return "Sealed";
    case ShuffleError::kNotSealed:        return "NotSealed";
    case ShuffleError::kClosed:           return "Closed";
    case ShuffleError::kReleased:         return "Released";
    case ShuffleError::kIllegalState:     return "IllegalState";
    case ShuffleError::kMissingSegment:   return "MissingSegment";
    case ShuffleError::kRegionNotFlushed: return "RegionNotFlushed";
    case ShuffleError::kQueueFull:        return "QueueFull";
    case ShuffleError::kCancelled:        return "Cancelled";
  }
  return "Unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error return type.
 *
 * Holds either a V (success) or an E (error). V may be move-only.
 *
 * Usage:
 * @code
 *   auto r = store.CreateReader(opts);
 *   if (!r.has_value()) return r.get_error();
 *   auto reader = std::move(r.value());
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& value) {
    return expected(ValueTag{}, value);
  }

  static expected success(V&& value) {
    return expected(ValueTag{}, std::move(value));
  }

  static expected error(E err) noexcept { return expected(ErrorTag{}, err); }

  expected(const expected& other) : has_value_(false), err_(other.err_) {
    if (other.has_value_) {
      ::new (&storage_) V(*other.Ptr());
      has_value_ = true;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(false), err_(other.err_) {
    if (other.has_value_) {
      ::new (&storage_) V(std::move(*other.Ptr()));
      has_value_ = true;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (&storage_) V(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (&storage_) V(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    SHUFFLE_ASSERT(has_value_);
    return *Ptr();
  }

  const V& value() const& noexcept {
    SHUFFLE_ASSERT(has_value_);
    return *Ptr();
  }

  V&& value() && noexcept {
    SHUFFLE_ASSERT(has_value_);
    return std::move(*Ptr());
  }

  E get_error() const noexcept {
    SHUFFLE_ASSERT(!has_value_);
    return err_;
  }

  template <typename U>
  V value_or(U&& default_value) const& {
    return has_value_ ? *Ptr() : static_cast<V>(std::forward<U>(default_value));
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  template <typename U>
  expected(ValueTag, U&& value) : has_value_(true), err_() {
    ::new (&storage_) V(std::forward<U>(value));
  }

  expected(ErrorTag, E err) noexcept : has_value_(false), err_(err) {}

  V* Ptr() noexcept { return std::launder(reinterpret_cast<V*>(&storage_)); }
  const V* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const V*>(&storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ptr()->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_value_;
  E err_;
};

/// @brief expected<void, E>: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    SHUFFLE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E err) noexcept : has_value_(ok), err_(err) {}

  bool has_value_;
  E err_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& value) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_) T(value);
  }

  optional(T&& value) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_) T(std::move(value));
  }

  optional(const optional& other) : has_value_(false) {
    if (other.has_value_) {
      ::new (&storage_) T(*other.Ptr());
      has_value_ = true;
    }
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(false) {
    if (other.has_value_) {
      ::new (&storage_) T(std::move(*other.Ptr()));
      has_value_ = true;
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    SHUFFLE_ASSERT(has_value_);
    return *Ptr();
  }

  const T& value() const noexcept {
    SHUFFLE_ASSERT(has_value_);
    return *Ptr();
  }

  T value_or(const T& default_value) const {
    return has_value_ ? *Ptr() : default_value;
  }

  T* operator->() noexcept { return &value(); }
  const T* operator->() const noexcept { return &value(); }

  void reset() noexcept {
    if (has_value_) {
      Ptr()->~T();
      has_value_ = false;
    }
  }

 private:
  T* Ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage_)); }
  const T* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const T*>(&storage_));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// PollResult<T>
// ============================================================================

/// Outcome of a non-blocking "give me the next unit" call.
enum class PollStatus : uint8_t {
  kReady = 0,        ///< A value was produced
  kNotYetAvailable,  ///< Nothing right now; retry after a notification
  kFinished          ///< End of stream; no value will ever be produced
};

/**
 * @brief Tri-state poll outcome.
 *
 * "Not yet available" and "finished" are distinct states so a caller never
 * has to guess what an empty result means.
 */
template <typename T>
class PollResult final {
 public:
  static PollResult Ready(T value) {
    PollResult r(PollStatus::kReady);
    r.value_ = optional<T>(std::move(value));
    return r;
  }

  static PollResult NotYetAvailable() noexcept {
    return PollResult(PollStatus::kNotYetAvailable);
  }

  static PollResult Finished() noexcept {
    return PollResult(PollStatus::kFinished);
  }

  PollStatus Status() const noexcept { return status_; }
  bool IsReady() const noexcept { return status_ == PollStatus::kReady; }
  bool IsNotYetAvailable() const noexcept {
    return status_ == PollStatus::kNotYetAvailable;
  }
  bool IsFinished() const noexcept { return status_ == PollStatus::kFinished; }

  T& value() noexcept {
    SHUFFLE_ASSERT(IsReady());
    return value_.value();
  }

  /// @brief Move the produced value out. Only valid when IsReady().
  T Take() {
    SHUFFLE_ASSERT(IsReady());
    return std::move(value_.value());
  }

 private:
  explicit PollResult(PollStatus status) noexcept : status_(status) {}

  PollStatus status_;
  optional<T> value_;
};

}  // namespace shuffle

#endif  // SHUFFLE_VOCABULARY_HPP_
