#include "ern/id/base32.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ern::id {

namespace {

constexpr uint8_t kInvalidDigit = 0xFF;

constexpr auto BuildDecodeTable() -> std::array<uint8_t, 256> {
  std::array<uint8_t, 256> table{};
  table.fill(kInvalidDigit);
  for (std::size_t i = 0; i < kBase32Alphabet.size(); ++i) {
    table[static_cast<uint8_t>(kBase32Alphabet[i])] = static_cast<uint8_t>(i);
  }
  return table;
}

constexpr auto kDecodeTable = BuildDecodeTable();

// Five bits of the 128-bit value starting at bit `pos` (0 = LSB of low).
auto ExtractDigit(const Token& token, unsigned pos) -> uint8_t {
  uint64_t chunk = 0;
  if (pos >= 64) {
    chunk = token.high >> (pos - 64);
  } else if (pos == 0) {
    chunk = token.low;
  } else {
    chunk = (token.low >> pos) | (token.high << (64 - pos));
  }
  return static_cast<uint8_t>(chunk & 0x1F);
}

}  // namespace

auto EncodeBase32(const Token& token) -> std::string {
  std::string out(kEncodedTokenLength, '0');
  for (std::size_t i = 0; i < kEncodedTokenLength; ++i) {
    auto pos = static_cast<unsigned>(5 * (kEncodedTokenLength - 1 - i));
    out[i] = kBase32Alphabet[ExtractDigit(token, pos)];
  }
  return out;
}

auto DecodeBase32(std::string_view text) -> std::optional<Token> {
  if (text.size() != kEncodedTokenLength || text.front() > '7') {
    return std::nullopt;
  }

  Token token;
  for (char c : text) {
    uint8_t digit = kDecodeTable[static_cast<uint8_t>(c)];
    if (digit == kInvalidDigit) {
      return std::nullopt;
    }
    token.high = (token.high << 5) | (token.low >> 59);
    token.low = (token.low << 5) | digit;
  }
  return token;
}

}  // namespace ern::id
