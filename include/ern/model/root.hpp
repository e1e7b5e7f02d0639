#pragma once

#include <chrono>
#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "ern/common/error.hpp"
#include "ern/id/root_id_generator.hpp"
#include "ern/id/token.hpp"

namespace ern {

// Unique, time-ordered base identifier of an ERN.
//
// A generated root is named "<base>_<token>", where token is the 26-character
// base32 form of a RootIdGenerator token. Roots order by token first, so
// generated roots sort by creation time whatever their base names. Names
// without a well-formed token suffix (parsed literals) sort before all
// generated roots, by name.
class Root {
 public:
  static constexpr std::string_view kDefaultBase = "root";
  static constexpr char kTokenSeparator = '_';

  // Fresh root from a base name, using the process-wide generator.
  static auto Create(std::string_view base) -> Result<Root>;
  static auto Create(std::string_view base, id::RootIdGenerator& generator)
      -> Result<Root>;

  // Root taken verbatim from an existing name. Never generates a token, so
  // formatting then parsing yields an equal root.
  static auto Parse(std::string_view name) -> Result<Root>;

  // Root with the default base name and a fresh token.
  static auto Default() -> Root;

  // Full name, including the token suffix when there is one.
  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto AsStringView() const -> std::string_view {
    return name_;
  }
  [[nodiscard]] auto ToString() const -> std::string {
    return name_;
  }

  // Name without the token suffix. The full name when there is no token.
  [[nodiscard]] auto Base() const -> std::string_view;

  // The encoded token suffix, if the name carries one.
  [[nodiscard]] auto Token() const -> std::optional<std::string_view>;

  // Creation time (millisecond precision) decoded from the token.
  [[nodiscard]] auto Timestamp() const
      -> std::optional<std::chrono::system_clock::time_point>;

  auto operator==(const Root& other) const -> bool {
    return name_ == other.name_;
  }
  auto operator<=>(const Root& other) const -> std::strong_ordering;

  friend auto operator<<(std::ostream& os, const Root& root) -> std::ostream& {
    return os << root.name_;
  }

 private:
  // `base` must already be validated.
  static auto Generate(std::string_view base, id::RootIdGenerator& generator)
      -> Root;

  Root(std::string name, std::optional<id::Token> token)
      : name_(std::move(name)), token_(token) {
  }

  std::string name_;
  std::optional<id::Token> token_;
};

}  // namespace ern

template <>
struct std::hash<ern::Root> {
  auto operator()(const ern::Root& root) const noexcept -> std::size_t {
    return std::hash<std::string_view>{}(root.AsStringView());
  }
};
