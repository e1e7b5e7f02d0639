#pragma once

#include <compare>
#include <cstddef>
#include <expected>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "ern/common/error.hpp"

namespace ern {

namespace detail {

// Grammar delimiters. Never valid inside a segment.
inline constexpr char kFieldDelimiter = ':';
inline constexpr char kPathDelimiter = '/';

// Shared segment rule: non-empty, no ':' and no '/'.
// `component` is used as the error's component name.
auto ValidateSegment(std::string_view component, std::string_view value)
    -> std::expected<void, Error>;

}  // namespace detail

// Validated, immutable string wrapper for one delimiter-free grammar segment.
// Traits provide the component name used in errors (kName) and, for
// positional segments, the default value (kDefault).
template <typename Traits>
class Segment {
 public:
  static auto Create(std::string_view value) -> Result<Segment> {
    if (auto valid = detail::ValidateSegment(Traits::kName, value); !valid) {
      return std::unexpected(std::move(valid).error());
    }
    return Segment(std::string(value));
  }

  // Text parsing entry point. Same rules as Create.
  static auto Parse(std::string_view text) -> Result<Segment> {
    return Create(text);
  }

  static auto Default() -> Segment
    requires requires { Traits::kDefault; }
  {
    return Segment(std::string(Traits::kDefault));
  }

  static constexpr auto ComponentName() -> std::string_view {
    return Traits::kName;
  }

  [[nodiscard]] auto AsStringView() const -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto ToString() const -> std::string {
    return value_;
  }

  auto operator==(const Segment&) const -> bool = default;
  auto operator<=>(const Segment&) const = default;

  friend auto operator<<(std::ostream& os, const Segment& segment)
      -> std::ostream& {
    return os << segment.value_;
  }

 private:
  explicit Segment(std::string value) : value_(std::move(value)) {
  }

  std::string value_;
};

struct DomainTraits {
  static constexpr std::string_view kName = "Domain";
  static constexpr std::string_view kDefault = "acton";
};

struct CategoryTraits {
  static constexpr std::string_view kName = "Category";
  static constexpr std::string_view kDefault = "reactive";
};

struct AccountTraits {
  static constexpr std::string_view kName = "Account";
  static constexpr std::string_view kDefault = "acton";
};

// Parts have no default: a path level is always named explicitly.
struct PartTraits {
  static constexpr std::string_view kName = "Part";
};

using Domain = Segment<DomainTraits>;
using Category = Segment<CategoryTraits>;
using Account = Segment<AccountTraits>;
using Part = Segment<PartTraits>;

}  // namespace ern

template <typename Traits>
struct std::hash<ern::Segment<Traits>> {
  auto operator()(const ern::Segment<Traits>& segment) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(segment.AsStringView());
  }
};
