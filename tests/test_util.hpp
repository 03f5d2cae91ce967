/**
 * @file test_util.hpp
 * @brief Helpers shared by the shuffle tests.
 */

#ifndef SHUFFLE_TESTS_TEST_UTIL_HPP_
#define SHUFFLE_TESTS_TEST_UTIL_HPP_

#include "shuffle/buffer.hpp"

#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace shuffle_test {

/// Unique file name under /tmp, removed on scope exit.
class TempPath {
 public:
  TempPath() {
    char tmpl[] = "/tmp/shuffle_test_XXXXXX";
    int fd = ::mkstemp(tmpl);
    if (fd >= 0) {
      ::close(fd);
    }
    path_ = tmpl;
  }

  ~TempPath() { ::unlink(path_.c_str()); }

  TempPath(const TempPath&) = delete;
  TempPath& operator=(const TempPath&) = delete;

  const char* c_str() const noexcept { return path_.c_str(); }

 private:
  std::string path_;
};

/// Payload of @p size bytes where byte i is (seed + i) mod 256.
inline std::vector<uint8_t> Pattern(uint32_t size, uint8_t seed) {
  std::vector<uint8_t> v(size);
  for (uint32_t i = 0; i < size; ++i) {
    v[i] = static_cast<uint8_t>(seed + i);
  }
  return v;
}

inline shuffle::Buffer DataBuffer(uint32_t size, uint8_t seed) {
  auto bytes = Pattern(size, seed);
  return shuffle::Buffer::Allocate(bytes.data(), size,
                                   shuffle::DataType::kDataBuffer);
}

inline shuffle::Buffer EventBuffer(uint8_t tag) {
  return shuffle::Buffer::Allocate(&tag, 1U, shuffle::DataType::kEventBuffer);
}

inline bool SameBytes(const uint8_t* data, uint32_t size, uint8_t seed) {
  for (uint32_t i = 0; i < size; ++i) {
    if (data[i] != static_cast<uint8_t>(seed + i)) return false;
  }
  return true;
}

}  // namespace shuffle_test

#endif  // SHUFFLE_TESTS_TEST_UTIL_HPP_
