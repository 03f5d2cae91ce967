/**
 * @file options.hpp
 * @brief Typed shuffle options read from a ConfigStore.
 *
 * Recognized entries:
 *   [bounded] segment_size         bytes per pooled read segment (> 0)
 *   [bounded] read_ahead_segments  segments per reader, k (>= 1)
 *   [bounded] zero_copy            serve file regions instead of buffers
 *   [log]     level                debug | info | warn | error | off
 *
 * Absent entries keep their defaults; malformed or out-of-range values are
 * ConfigError::kInvalidValue.
 */

#ifndef SHUFFLE_OPTIONS_HPP_
#define SHUFFLE_OPTIONS_HPP_

#include "shuffle/bounded_store.hpp"
#include "shuffle/config.hpp"
#include "shuffle/log.hpp"
#include "shuffle/vocabulary.hpp"

#include <cstdint>

namespace shuffle {

struct ShuffleOptions {
  uint32_t segment_size = SHUFFLE_BOUNDED_DEFAULT_SEGMENT_SIZE;
  uint32_t read_ahead_segments = SHUFFLE_BOUNDED_DEFAULT_READ_AHEAD;
  bool zero_copy = false;
  bool has_log_level = false;
  log::Level log_level = log::Level::kInfo;

  static expected<ShuffleOptions, ConfigError> FromConfig(
      const ConfigStore& cfg) {
    ShuffleOptions opts;

    auto segment_size = cfg.ParseInt("bounded", "segment_size");
    if (!segment_size.has_value()) {
      return Invalid("bounded", "segment_size");
    }
    if (segment_size.value().has_value()) {
      int64_t v = segment_size.value().value();
      if (v <= 0 || v > static_cast<int64_t>(UINT32_MAX)) {
        return Invalid("bounded", "segment_size");
      }
      opts.segment_size = static_cast<uint32_t>(v);
    }

    auto read_ahead = cfg.ParseInt("bounded", "read_ahead_segments");
    if (!read_ahead.has_value()) {
      return Invalid("bounded", "read_ahead_segments");
    }
    if (read_ahead.value().has_value()) {
      int64_t v = read_ahead.value().value();
      if (v < 1 || v > static_cast<int64_t>(UINT32_MAX)) {
        return Invalid("bounded", "read_ahead_segments");
      }
      opts.read_ahead_segments = static_cast<uint32_t>(v);
    }

    auto zero_copy = cfg.ParseBool("bounded", "zero_copy");
    if (!zero_copy.has_value()) {
      return Invalid("bounded", "zero_copy");
    }
    opts.zero_copy = zero_copy.value().value_or(false);

    if (cfg.HasKey("log", "level")) {
      if (!log::ParseLevel(cfg.GetString("log", "level"), opts.log_level)) {
        return Invalid("log", "level");
      }
      opts.has_log_level = true;
    }
    return expected<ShuffleOptions, ConfigError>::success(opts);
  }

  BoundedReadOptions ToReadOptions() const noexcept {
    BoundedReadOptions r;
    r.segment_size = segment_size;
    r.num_segments = read_ahead_segments;
    r.mode = zero_copy ? ReadMode::kFileRegion : ReadMode::kBuffer;
    return r;
  }

  /// @brief Apply the configured log level, if one was given.
  void ApplyLogLevel() const noexcept {
    if (has_log_level) {
      log::SetLevel(log_level);
    }
  }

 private:
  static expected<ShuffleOptions, ConfigError> Invalid(const char* section,
                                                       const char* key) {
    SHUFFLE_LOG_WARN("Options", "invalid value for [%s] %s", section, key);
    return expected<ShuffleOptions, ConfigError>::error(
        ConfigError::kInvalidValue);
  }
};

}  // namespace shuffle

#endif  // SHUFFLE_OPTIONS_HPP_
