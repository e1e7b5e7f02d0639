#include "ern/common/error.hpp"

#include <format>
#include <print>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/color.h>

namespace ern {

auto Error::EmptyValue(std::string_view component) -> Error {
  return Error{
      .kind = ErrorKind::kEmptyValue,
      .component = std::string(component),
      .message = std::format("{} cannot be empty", component)};
}

auto Error::InvalidFormat(std::string_view component, std::string detail)
    -> Error {
  return Error{
      .kind = ErrorKind::kInvalidFormat,
      .component = std::string(component),
      .message = std::move(detail)};
}

auto ToString(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::kEmptyValue:
      return "empty value";
    case ErrorKind::kInvalidFormat:
      return "invalid format";
  }
  return "unknown";
}

auto FormatError(const Error& error) -> std::string {
  return std::format("{}: {}", ToString(error.kind), error.message);
}

void PrintError(const Error& error, bool colors) {
  constexpr auto kKindColor = fmt::terminal_color::bright_red;

  if (colors) {
    fmt::print(
        stderr, "{}: {}\n",
        fmt::styled(ToString(error.kind), fmt::fg(kKindColor)),
        fmt::styled(error.message, fmt::emphasis::bold));
  } else {
    std::print(stderr, "{}: {}\n", ToString(error.kind), error.message);
  }
}

}  // namespace ern
