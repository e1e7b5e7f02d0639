#pragma once

#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ern/common/error.hpp"
#include "ern/model/segment.hpp"

namespace ern {

// Ordered hierarchical path below a root. Element order is the path from the
// root to the leaf. An empty sequence is valid.
class Parts {
 public:
  Parts() = default;

  explicit Parts(std::vector<Part> parts) : parts_(std::move(parts)) {
  }

  // Validate every value as a Part. Fails on the first invalid element; no
  // partial result is produced.
  template <std::ranges::input_range R>
    requires std::convertible_to<
        std::ranges::range_reference_t<R>, std::string_view>
  static auto FromStrings(R&& values) -> Result<Parts> {
    std::vector<Part> parts;
    for (auto&& value : values) {
      auto part = Part::Create(std::string_view(value));
      if (!part) {
        return std::unexpected(std::move(part).error());
      }
      parts.push_back(*std::move(part));
    }
    return Parts(std::move(parts));
  }

  static auto FromStrings(std::initializer_list<std::string_view> values)
      -> Result<Parts> {
    return FromStrings(std::vector<std::string_view>(values));
  }

  [[nodiscard]] auto Append(Part part) const -> Parts;

  // Elements of this followed by elements of other.
  [[nodiscard]] auto Concat(const Parts& other) const -> Parts;

  // All elements but the last. Empty stays empty.
  [[nodiscard]] auto WithoutLast() const -> Parts;

  [[nodiscard]] auto StartsWith(const Parts& prefix) const -> bool;

  [[nodiscard]] auto Size() const -> std::size_t {
    return parts_.size();
  }
  [[nodiscard]] auto IsEmpty() const -> bool {
    return parts_.empty();
  }
  [[nodiscard]] auto Elements() const -> std::span<const Part> {
    return parts_;
  }
  [[nodiscard]] auto operator[](std::size_t index) const -> const Part& {
    return parts_[index];
  }
  [[nodiscard]] auto begin() const {
    return parts_.begin();
  }
  [[nodiscard]] auto end() const {
    return parts_.end();
  }

  // Elements joined with '/'. Empty string for an empty sequence.
  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const Parts&) const -> bool = default;

  friend auto operator<<(std::ostream& os, const Parts& parts)
      -> std::ostream& {
    return os << parts.ToString();
  }

 private:
  std::vector<Part> parts_;
};

}  // namespace ern

template <>
struct std::hash<ern::Parts> {
  auto operator()(const ern::Parts& parts) const noexcept -> std::size_t;
};
