/**
 * @file test_file_channel.cpp
 * @brief Tests for file_channel.hpp
 */

#include "shuffle/file_channel.hpp"

#include <catch2/catch_test_macros.hpp>

#include "test_util.hpp"

#include <sys/stat.h>

#include <vector>

TEST_CASE("FileChannel append and read back", "[file_channel]") {
  shuffle_test::TempPath path;
  auto created = shuffle::FileChannel::Create(path.c_str());
  REQUIRE(created.has_value());
  shuffle::FileChannelPtr ch = created.value();
  REQUIRE(ch->Fd() >= 0);
  REQUIRE(ch->Path() == path.c_str());

  auto bytes = shuffle_test::Pattern(256, 1);
  REQUIRE(ch->Append(bytes.data(), bytes.size()).has_value());
  REQUIRE(ch->WritePosition() == 256);
  REQUIRE(ch->CurrentSize().value() == 256);

  std::vector<uint8_t> out(100);
  REQUIRE(ch->ReadFullyAt(out.data(), 100, 50).has_value());
  REQUIRE(shuffle_test::SameBytes(out.data(), 100, 51));
}

TEST_CASE("FileChannel ReadAt stops at end of file", "[file_channel]") {
  shuffle_test::TempPath path;
  auto ch = shuffle::FileChannel::Create(path.c_str()).value();
  auto bytes = shuffle_test::Pattern(10, 0);
  REQUIRE(ch->Append(bytes.data(), bytes.size()).has_value());

  uint8_t out[32];
  auto r = ch->ReadAt(out, sizeof(out), 4);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 6);
}

TEST_CASE("FileChannel ReadFullyAt reports truncation as corruption",
          "[file_channel]") {
  shuffle_test::TempPath path;
  auto ch = shuffle::FileChannel::Create(path.c_str()).value();
  auto bytes = shuffle_test::Pattern(10, 0);
  REQUIRE(ch->Append(bytes.data(), bytes.size()).has_value());

  uint8_t out[16];
  auto r = ch->ReadFullyAt(out, sizeof(out), 0);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shuffle::ShuffleError::kCorruptedData);
}

TEST_CASE("FileChannel MarkClosed cancels reads and writes",
          "[file_channel]") {
  shuffle_test::TempPath path;
  auto ch = shuffle::FileChannel::Create(path.c_str()).value();
  uint8_t b = 1;
  REQUIRE(ch->Append(&b, 1).has_value());

  REQUIRE(ch->MarkClosed());
  REQUIRE_FALSE(ch->MarkClosed());
  REQUIRE(ch->IsClosed());

  uint8_t out = 0;
  auto r = ch->ReadAt(&out, 1, 0);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shuffle::ShuffleError::kCancelled);

  auto w = ch->Append(&b, 1);
  REQUIRE(!w.has_value());
  REQUIRE(w.get_error() == shuffle::ShuffleError::kClosed);
}

TEST_CASE("FileChannel Unlink removes the name but keeps the data",
          "[file_channel]") {
  shuffle_test::TempPath path;
  auto ch = shuffle::FileChannel::Create(path.c_str()).value();
  auto bytes = shuffle_test::Pattern(8, 9);
  REQUIRE(ch->Append(bytes.data(), bytes.size()).has_value());

  REQUIRE(ch->Unlink().has_value());
  struct stat st;
  REQUIRE(::stat(path.c_str(), &st) != 0);

  uint8_t out[8];
  REQUIRE(ch->ReadFullyAt(out, 8, 0).has_value());
  REQUIRE(shuffle_test::SameBytes(out, 8, 9));

  // A second unlink of a missing name is fine.
  REQUIRE(ch->Unlink().has_value());
}

TEST_CASE("FileChannel Create fails for a missing directory",
          "[file_channel]") {
  auto r = shuffle::FileChannel::Create("/nonexistent_dir_xyz/spill.bin");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shuffle::ShuffleError::kIoError);
}
