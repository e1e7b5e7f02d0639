#include "ern/model/ern.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ern/common/error.hpp"
#include "ern/model/parts.hpp"
#include "ern/model/root.hpp"
#include "ern/model/segment.hpp"
#include "ern/parser.hpp"

namespace ern {

auto Ern::Default() -> Ern {
  return Ern(
      Domain::Default(), Category::Default(), Account::Default(),
      Root::Default());
}

auto Ern::WithRoot(std::string_view base) -> Result<Ern> {
  auto root = Root::Create(base);
  if (!root) {
    return std::unexpected(std::move(root).error());
  }
  return Ern(
      Domain::Default(), Category::Default(), Account::Default(),
      *std::move(root));
}

auto Ern::WithDomain(std::string_view domain) -> Result<Ern> {
  auto value = Domain::Create(domain);
  if (!value) {
    return std::unexpected(std::move(value).error());
  }
  return Ern(
      *std::move(value), Category::Default(), Account::Default(),
      Root::Default());
}

auto Ern::WithCategory(std::string_view category) -> Result<Ern> {
  auto value = Category::Create(category);
  if (!value) {
    return std::unexpected(std::move(value).error());
  }
  return Ern(
      Domain::Default(), *std::move(value), Account::Default(),
      Root::Default());
}

auto Ern::WithAccount(std::string_view account) -> Result<Ern> {
  auto value = Account::Create(account);
  if (!value) {
    return std::unexpected(std::move(value).error());
  }
  return Ern(
      Domain::Default(), Category::Default(), *std::move(value),
      Root::Default());
}

auto Ern::Parse(std::string_view text) -> Result<Ern> {
  return ErnParser(std::string(text)).Parse();
}

auto Ern::WithNewRoot(std::string_view base) const -> Result<Ern> {
  auto root = Root::Create(base);
  if (!root) {
    return std::unexpected(std::move(root).error());
  }
  return WithNewRoot(*std::move(root));
}

auto Ern::WithNewRoot(Root root) const -> Ern {
  return Ern(domain_, category_, account_, std::move(root), parts_);
}

auto Ern::AddPart(std::string_view part) const -> Result<Ern> {
  auto value = Part::Create(part);
  if (!value) {
    return std::unexpected(std::move(value).error());
  }
  return WithPartsReplaced(parts_.Append(*std::move(value)));
}

auto Ern::IsChildOf(const Ern& other) const -> bool {
  return domain_ == other.domain_ && category_ == other.category_ &&
         account_ == other.account_ && root_ == other.root_ &&
         other.parts_.Size() < parts_.Size() &&
         parts_.StartsWith(other.parts_);
}

auto Ern::Parent() const -> std::optional<Ern> {
  if (parts_.IsEmpty()) {
    return std::nullopt;
  }
  return WithPartsReplaced(parts_.WithoutLast());
}

auto Ern::Combine(const Ern& child) const -> Ern {
  return WithPartsReplaced(parts_.Concat(child.parts_));
}

auto Ern::ToString() const -> std::string {
  std::string out(kPrefix);
  out += domain_.AsStringView();
  out += ':';
  out += category_.AsStringView();
  out += ':';
  out += account_.AsStringView();
  out += ':';
  out += root_.AsStringView();
  if (!parts_.IsEmpty()) {
    out += '/';
    out += parts_.ToString();
  }
  return out;
}

auto Ern::WithPartsReplaced(Parts parts) const -> Ern {
  return Ern(domain_, category_, account_, root_, std::move(parts));
}

}  // namespace ern

auto std::hash<ern::Ern>::operator()(const ern::Ern& ern) const noexcept
    -> std::size_t {
  std::size_t seed = 0;
  auto mix = [&seed](std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  };
  mix(std::hash<ern::Domain>{}(ern.GetDomain()));
  mix(std::hash<ern::Category>{}(ern.GetCategory()));
  mix(std::hash<ern::Account>{}(ern.GetAccount()));
  mix(std::hash<ern::Root>{}(ern.GetRoot()));
  mix(std::hash<ern::Parts>{}(ern.GetParts()));
  return seed;
}
