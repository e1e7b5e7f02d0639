#pragma once

#include <compare>
#include <cstdint>

namespace ern::id {

// 128-bit time-ordered id, laid out as a UUIDv7 (RFC 9562):
//
//   high: [48 unix_ms][4 version=7][12 sub_ms]
//   low:  [2 variant=0b10][30 counter][32 random]
//
// Numeric order of (high, low) is creation order.
struct Token {
  uint64_t high = 0;
  uint64_t low = 0;

  static constexpr uint64_t kVersion = 7;
  static constexpr uint64_t kVariant = 0b10;
  static constexpr int kCounterBits = 30;
  static constexpr int kSubMillisBits = 12;
  static constexpr uint64_t kMaxCounter = (uint64_t{1} << kCounterBits) - 1;
  static constexpr uint64_t kMaxSubMillis = (uint64_t{1} << kSubMillisBits) - 1;

  static constexpr auto Make(
      uint64_t unix_ms, uint64_t sub_ms, uint64_t counter, uint32_t random)
      -> Token {
    return Token{
        .high = (unix_ms << 16) | (kVersion << 12) | (sub_ms & kMaxSubMillis),
        .low = (kVariant << 62) | ((counter & kMaxCounter) << 32) | random};
  }

  [[nodiscard]] constexpr auto UnixMillis() const -> uint64_t {
    return high >> 16;
  }
  [[nodiscard]] constexpr auto Version() const -> uint64_t {
    return (high >> 12) & 0xF;
  }
  [[nodiscard]] constexpr auto SubMillis() const -> uint64_t {
    return high & kMaxSubMillis;
  }
  [[nodiscard]] constexpr auto Variant() const -> uint64_t {
    return low >> 62;
  }
  [[nodiscard]] constexpr auto Counter() const -> uint64_t {
    return (low >> 32) & kMaxCounter;
  }

  auto operator<=>(const Token&) const = default;
};

}  // namespace ern::id
