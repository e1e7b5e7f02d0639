#pragma once

#include <concepts>
#include <expected>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ern/common/error.hpp"
#include "ern/config/ern_config.hpp"
#include "ern/id/root_id_generator.hpp"
#include "ern/model/ern.hpp"
#include "ern/model/parts.hpp"
#include "ern/model/root.hpp"
#include "ern/model/segment.hpp"

namespace ern {

// Fluent, validating construction of an Ern from individual components.
//
// Each step validates its component immediately. The first failure is kept
// and every later step is ignored; Build() then returns that failure. A
// builder that never failed produces an Ern whose components are all valid.
//
// Usage:
//   auto ern = ErnBuilder()
//                  .WithDomain("acme")
//                  .WithCategory("billing")
//                  .WithRoot("invoice")
//                  .AddPart("2024")
//                  .Build();
//
class ErnBuilder {
 public:
  // Built-in defaults, process-wide root generator.
  ErnBuilder();

  // Defaults from a loaded ern.toml.
  explicit ErnBuilder(const config::ErnConfig& config);

  auto WithDomain(std::string_view domain) -> ErnBuilder&;
  auto WithCategory(std::string_view category) -> ErnBuilder&;
  auto WithAccount(std::string_view account) -> ErnBuilder&;

  // Base name for the root generated at Build(). Validated now. Replaces a
  // root set earlier.
  auto WithRoot(std::string_view base) -> ErnBuilder&;

  // Root used as-is (e.g. parsed from an existing ERN). Replaces a base name
  // set earlier.
  auto WithRoot(Root root) -> ErnBuilder&;

  auto AddPart(std::string_view part) -> ErnBuilder&;

  // Replace all parts added so far.
  template <std::ranges::input_range R>
    requires std::convertible_to<
        std::ranges::range_reference_t<R>, std::string_view>
  auto WithParts(R&& values) -> ErnBuilder& {
    if (!error_) {
      auto parts = Parts::FromStrings(std::forward<R>(values));
      if (parts) {
        parts_ = *std::move(parts);
      } else {
        error_ = std::move(parts).error();
      }
    }
    return *this;
  }

  auto WithParts(std::initializer_list<std::string_view> values)
      -> ErnBuilder& {
    return WithParts(std::vector<std::string_view>(values));
  }

  // Generator for the root created at Build(). Order relative to WithRoot does
  // not matter. Must outlive the builder.
  auto UsingGenerator(id::RootIdGenerator& generator) -> ErnBuilder&;

  // First recorded error, if any step failed.
  [[nodiscard]] auto GetError() const -> const std::optional<Error>& {
    return error_;
  }

  // Produce the Ern, or the first error. Unless an existing Root was given,
  // a fresh root is generated from the base name on every call.
  [[nodiscard]] auto Build() const -> Result<Ern>;

 private:
  template <typename SegmentT>
  void Assign(SegmentT& slot, std::string_view value) {
    if (error_) {
      return;
    }
    auto segment = SegmentT::Create(value);
    if (segment) {
      slot = *std::move(segment);
    } else {
      error_ = std::move(segment).error();
    }
  }

  Domain domain_;
  Category category_;
  Account account_;
  std::optional<Root> root_;
  Parts parts_;
  std::string root_base_;
  id::RootIdGenerator* generator_;
  std::optional<Error> error_;
};

}  // namespace ern
