#include "ern/model/root.hpp"

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ern/common/error.hpp"
#include "ern/id/base32.hpp"
#include "ern/id/root_id_generator.hpp"
#include "ern/model/segment.hpp"

namespace ern {

namespace {

constexpr std::string_view kComponent = "Root";

// Length of "_<token>".
constexpr std::size_t kSuffixLength = id::kEncodedTokenLength + 1;

auto HasTokenSuffix(std::string_view name) -> bool {
  return name.size() > kSuffixLength &&
         name[name.size() - kSuffixLength] == Root::kTokenSeparator &&
         id::DecodeBase32(name.substr(name.size() - id::kEncodedTokenLength))
             .has_value();
}

}  // namespace

auto Root::Create(std::string_view base) -> Result<Root> {
  return Create(base, id::RootIdGenerator::Default());
}

auto Root::Create(std::string_view base, id::RootIdGenerator& generator)
    -> Result<Root> {
  if (auto valid = detail::ValidateSegment(kComponent, base); !valid) {
    return std::unexpected(std::move(valid).error());
  }
  return Generate(base, generator);
}

auto Root::Parse(std::string_view name) -> Result<Root> {
  if (auto valid = detail::ValidateSegment(kComponent, name); !valid) {
    return std::unexpected(std::move(valid).error());
  }
  std::optional<id::Token> token;
  if (HasTokenSuffix(name)) {
    token =
        id::DecodeBase32(name.substr(name.size() - id::kEncodedTokenLength));
  }
  return Root(std::string(name), token);
}

auto Root::Default() -> Root {
  return Generate(kDefaultBase, id::RootIdGenerator::Default());
}

auto Root::Generate(std::string_view base, id::RootIdGenerator& generator)
    -> Root {
  auto token = generator.Next();
  std::string name(base);
  name += kTokenSeparator;
  name += id::EncodeBase32(token);
  return Root(std::move(name), token);
}

auto Root::Base() const -> std::string_view {
  std::string_view name = name_;
  if (!token_) {
    return name;
  }
  return name.substr(0, name.size() - kSuffixLength);
}

auto Root::Token() const -> std::optional<std::string_view> {
  if (!token_) {
    return std::nullopt;
  }
  return std::string_view(name_).substr(
      name_.size() - id::kEncodedTokenLength);
}

auto Root::Timestamp() const
    -> std::optional<std::chrono::system_clock::time_point> {
  if (!token_) {
    return std::nullopt;
  }
  return std::chrono::system_clock::time_point(
      std::chrono::milliseconds(static_cast<int64_t>(token_->UnixMillis())));
}

auto Root::operator<=>(const Root& other) const -> std::strong_ordering {
  if (auto cmp = token_ <=> other.token_; cmp != 0) {
    return cmp;
  }
  return name_ <=> other.name_;
}

}  // namespace ern
