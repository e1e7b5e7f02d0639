#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "ern/id/token.hpp"

namespace ern::id {

// Lowercase Crockford base32 alphabet. Ascending in ASCII, so fixed-width
// encodings compare as strings in the same order as their values.
inline constexpr std::string_view kBase32Alphabet =
    "0123456789abcdefghjkmnpqrstvwxyz";

// 128 bits in 26 characters; the two spare leading bits are zero, so the
// first character is always in '0'..'7'.
inline constexpr std::size_t kEncodedTokenLength = 26;

auto EncodeBase32(const Token& token) -> std::string;

// Returns nullopt unless `text` is exactly 26 lowercase alphabet characters
// with a leading character in '0'..'7'.
auto DecodeBase32(std::string_view text) -> std::optional<Token>;

}  // namespace ern::id
