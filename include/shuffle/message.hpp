/**
 * @file message.hpp
 * @brief Outbound response shapes produced for the transport layer.
 *
 * Two shapes exist:
 *   - BufferResponse:     payload bytes are resident in a Buffer.
 *   - FileRegionResponse: payload stays in the spill file; the transport
 *                         sends (channel, offset, size) zero-copy.
 *
 * Byte-level framing onto a socket is done by the transport, not here.
 */

#ifndef SHUFFLE_MESSAGE_HPP_
#define SHUFFLE_MESSAGE_HPP_

#include "shuffle/buffer.hpp"
#include "shuffle/file_channel.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>

#include <variant>

namespace shuffle {

// ============================================================================
// ReceiverId
// ============================================================================

/**
 * @brief 128-bit id of the consuming input channel.
 */
struct ReceiverId {
  uint64_t upper = 0U;
  uint64_t lower = 0U;

  bool operator==(const ReceiverId& other) const noexcept {
    return upper == other.upper && lower == other.lower;
  }
  bool operator!=(const ReceiverId& other) const noexcept {
    return !(*this == other);
  }
};

// ============================================================================
// Responses
// ============================================================================

/// Header fields common to both response shapes.
struct ResponseInfo {
  ReceiverId receiver_id;
  int32_t sequence_number = 0;
  int32_t backlog = 0;
  DataType data_type = DataType::kNone;
  bool is_compressed = false;
  uint32_t length = 0U;
};

struct BufferResponse {
  ResponseInfo info;
  Buffer buffer;
};

struct FileRegionResponse {
  ResponseInfo info;
  FileChannelPtr channel;
  uint64_t offset = 0U;
  uint32_t size = 0U;
  uint64_t file_size = 0U;  ///< Channel size observed when the response was built
};

using WireMessage = std::variant<BufferResponse, FileRegionResponse>;

inline const ResponseInfo& InfoOf(const WireMessage& msg) noexcept {
  if (const auto* b = std::get_if<BufferResponse>(&msg)) {
    return b->info;
  }
  return std::get<FileRegionResponse>(msg).info;
}

inline bool IsFileRegion(const WireMessage& msg) noexcept {
  return std::holds_alternative<FileRegionResponse>(msg);
}

/// @brief One-line description for logging, e.g. "buffer seq=3 DATA_BUFFER len=64".
inline void DescribeMessage(const WireMessage& msg, char* buf,
                            size_t bufsz) noexcept {
  const ResponseInfo& info = InfoOf(msg);
  if (const auto* f = std::get_if<FileRegionResponse>(&msg)) {
    (void)std::snprintf(buf, bufsz,
                        "file-region seq=%d backlog=%d %s len=%u off=%" PRIu64,
                        info.sequence_number, info.backlog,
                        DataTypeName(info.data_type), info.length, f->offset);
    return;
  }
  (void)std::snprintf(buf, bufsz, "buffer seq=%d backlog=%d %s len=%u",
                      info.sequence_number, info.backlog,
                      DataTypeName(info.data_type), info.length);
}

}  // namespace shuffle

#endif  // SHUFFLE_MESSAGE_HPP_
