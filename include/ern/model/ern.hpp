#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

#include "ern/common/error.hpp"
#include "ern/model/parts.hpp"
#include "ern/model/root.hpp"
#include "ern/model/segment.hpp"

namespace ern {

// Entity Resource Name:
//
//   ern:<domain>:<category>:<account>:<root>[/<part>/<part>...]
//
// Immutable. Operations that "modify" an Ern return a new one.
// Equality is structural over all five components; ordering is by root only,
// which makes Erns sort by creation time.
class Ern {
 public:
  static constexpr std::string_view kPrefix = "ern:";

  Ern(Domain domain, Category category, Account account, Root root,
      Parts parts = {})
      : domain_(std::move(domain)),
        category_(std::move(category)),
        account_(std::move(account)),
        root_(std::move(root)),
        parts_(std::move(parts)) {
  }

  // Default domain, category and account, no parts, fresh default root.
  static auto Default() -> Ern;

  // Validate one component and default the rest.
  static auto WithRoot(std::string_view base) -> Result<Ern>;
  static auto WithDomain(std::string_view domain) -> Result<Ern>;
  static auto WithCategory(std::string_view category) -> Result<Ern>;
  static auto WithAccount(std::string_view account) -> Result<Ern>;

  // Shortcut for ErnParser(text).Parse().
  static auto Parse(std::string_view text) -> Result<Ern>;

  [[nodiscard]] auto GetDomain() const -> const Domain& {
    return domain_;
  }
  [[nodiscard]] auto GetCategory() const -> const Category& {
    return category_;
  }
  [[nodiscard]] auto GetAccount() const -> const Account& {
    return account_;
  }
  [[nodiscard]] auto GetRoot() const -> const Root& {
    return root_;
  }
  [[nodiscard]] auto GetParts() const -> const Parts& {
    return parts_;
  }

  // Same domain, category, account and parts under a freshly generated root.
  [[nodiscard]] auto WithNewRoot(std::string_view base) const -> Result<Ern>;
  [[nodiscard]] auto WithNewRoot(Root root) const -> Ern;

  [[nodiscard]] auto AddPart(std::string_view part) const -> Result<Ern>;

  // Replace all parts. Fails without a partial result if any value is invalid.
  template <std::ranges::input_range R>
    requires std::convertible_to<
        std::ranges::range_reference_t<R>, std::string_view>
  auto WithParts(R&& values) const -> Result<Ern> {
    auto parts = Parts::FromStrings(std::forward<R>(values));
    if (!parts) {
      return std::unexpected(std::move(parts).error());
    }
    return WithPartsReplaced(*std::move(parts));
  }

  [[nodiscard]] auto WithParts(std::initializer_list<std::string_view> values)
      const -> Result<Ern> {
    auto parts = Parts::FromStrings(values);
    if (!parts) {
      return std::unexpected(std::move(parts).error());
    }
    return WithPartsReplaced(*std::move(parts));
  }

  // True when domain, category, account and root match and other's parts are
  // a strict prefix of ours.
  [[nodiscard]] auto IsChildOf(const Ern& other) const -> bool;

  // This Ern without its last part; nullopt at root level.
  [[nodiscard]] auto Parent() const -> std::optional<Ern>;

  // Path composition: keeps this Ern's domain, category, account and root and
  // appends child's parts. Child's other components are discarded.
  [[nodiscard]] auto Combine(const Ern& child) const -> Ern;

  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const Ern&) const -> bool = default;

  auto operator<=>(const Ern& other) const -> std::weak_ordering {
    return root_ <=> other.root_;
  }

  friend auto operator+(const Ern& parent, const Ern& child) -> Ern {
    return parent.Combine(child);
  }

  friend auto operator<<(std::ostream& os, const Ern& ern) -> std::ostream& {
    return os << ern.ToString();
  }

 private:
  [[nodiscard]] auto WithPartsReplaced(Parts parts) const -> Ern;

  Domain domain_;
  Category category_;
  Account account_;
  Root root_;
  Parts parts_;
};

}  // namespace ern

template <>
struct std::hash<ern::Ern> {
  auto operator()(const ern::Ern& ern) const noexcept -> std::size_t;
};
