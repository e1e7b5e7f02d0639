#pragma once

#include <exception>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace ern {

enum class ErrorKind { kEmptyValue, kInvalidFormat };

// Validation failure of one ERN component.
// `component` names the type that rejected the input ("Domain", "Part", "Ern",
// "Config", ...). `message` is the full human-readable text.
struct Error {
  ErrorKind kind;
  std::string component;
  std::string message;

  static auto EmptyValue(std::string_view component) -> Error;

  static auto InvalidFormat(std::string_view component, std::string detail)
      -> Error;

  auto operator==(const Error&) const -> bool = default;
};

template <typename T>
using Result = std::expected<T, Error>;

class ErnException : public std::exception {
 public:
  explicit ErnException(Error error) : error_(std::move(error)) {
  }

  [[nodiscard]] auto GetError() const -> const Error& {
    return error_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return error_.message.c_str();
  }

 private:
  Error error_;
};

// Unwrap a Result, throwing ErnException on failure.
template <typename T>
auto ValueOrThrow(Result<T> result) -> T {
  if (!result) {
    throw ErnException(std::move(result).error());
  }
  return *std::move(result);
}

auto ToString(ErrorKind kind) -> const char*;

// "<kind>: <message>", e.g. "invalid format: Part 'a:b' contains ':'"
auto FormatError(const Error& error) -> std::string;

// Print an error to stderr, optionally colored.
void PrintError(const Error& error, bool colors = true);

}  // namespace ern
