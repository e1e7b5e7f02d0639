#include "ern/builder.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include "ern/common/error.hpp"
#include "ern/config/ern_config.hpp"
#include "ern/id/root_id_generator.hpp"
#include "ern/model/ern.hpp"
#include "ern/model/root.hpp"
#include "ern/model/segment.hpp"

namespace ern {

ErnBuilder::ErnBuilder()
    : domain_(Domain::Default()),
      category_(Category::Default()),
      account_(Account::Default()),
      root_base_(Root::kDefaultBase),
      generator_(&id::RootIdGenerator::Default()) {
}

ErnBuilder::ErnBuilder(const config::ErnConfig& config)
    : domain_(config.domain),
      category_(config.category),
      account_(config.account),
      root_base_(config.root_base),
      generator_(&id::RootIdGenerator::Default()) {
}

auto ErnBuilder::WithDomain(std::string_view domain) -> ErnBuilder& {
  Assign(domain_, domain);
  return *this;
}

auto ErnBuilder::WithCategory(std::string_view category) -> ErnBuilder& {
  Assign(category_, category);
  return *this;
}

auto ErnBuilder::WithAccount(std::string_view account) -> ErnBuilder& {
  Assign(account_, account);
  return *this;
}

auto ErnBuilder::WithRoot(std::string_view base) -> ErnBuilder& {
  if (error_) {
    return *this;
  }
  if (auto valid = detail::ValidateSegment("Root", base); !valid) {
    error_ = std::move(valid).error();
    return *this;
  }
  root_base_ = std::string(base);
  root_.reset();
  return *this;
}

auto ErnBuilder::WithRoot(Root root) -> ErnBuilder& {
  if (!error_) {
    root_ = std::move(root);
  }
  return *this;
}

auto ErnBuilder::AddPart(std::string_view part) -> ErnBuilder& {
  if (error_) {
    return *this;
  }
  auto value = Part::Create(part);
  if (value) {
    parts_ = parts_.Append(*std::move(value));
  } else {
    error_ = std::move(value).error();
  }
  return *this;
}

auto ErnBuilder::UsingGenerator(id::RootIdGenerator& generator)
    -> ErnBuilder& {
  generator_ = &generator;
  return *this;
}

auto ErnBuilder::Build() const -> Result<Ern> {
  if (error_) {
    return std::unexpected(*error_);
  }

  auto root = root_;
  if (!root) {
    auto generated = Root::Create(root_base_, *generator_);
    if (!generated) {
      return std::unexpected(std::move(generated).error());
    }
    root = *std::move(generated);
  }

  return Ern(domain_, category_, account_, *std::move(root), parts_);
}

}  // namespace ern
