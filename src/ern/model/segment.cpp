#include "ern/model/segment.hpp"

#include <expected>
#include <format>
#include <string_view>

#include "ern/common/error.hpp"

namespace ern::detail {

auto ValidateSegment(std::string_view component, std::string_view value)
    -> std::expected<void, Error> {
  if (value.empty()) {
    return std::unexpected(Error::EmptyValue(component));
  }
  for (char c : value) {
    if (c == kFieldDelimiter || c == kPathDelimiter) {
      return std::unexpected(
          Error::InvalidFormat(
              component,
              std::format(
                  "{} '{}' contains reserved delimiter '{}'", component, value,
                  c)));
    }
  }
  return {};
}

}  // namespace ern::detail
