#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "ern/builder.hpp"
#include "ern/common/error.hpp"
#include "ern/config/ern_config.hpp"
#include "ern/id/clock.hpp"
#include "ern/id/root_id_generator.hpp"
#include "ern/model/ern.hpp"
#include "ern/model/root.hpp"
#include "ern/model/segment.hpp"

namespace ern {
namespace {

class ErnBuilderTest : public ::testing::Test {
 protected:
  std::shared_ptr<id::ManualClock> clock_ = std::make_shared<id::ManualClock>(
      std::chrono::milliseconds(1'704'067'200'000));
  id::RootIdGenerator generator_{clock_, 5};
};

TEST_F(ErnBuilderTest, DefaultsOnly) {
  auto ern = ErnBuilder().Build();
  ASSERT_TRUE(ern.has_value());
  EXPECT_EQ(ern->GetDomain(), Domain::Default());
  EXPECT_EQ(ern->GetCategory(), Category::Default());
  EXPECT_EQ(ern->GetAccount(), Account::Default());
  EXPECT_EQ(ern->GetRoot().Base(), Root::kDefaultBase);
  EXPECT_TRUE(ern->GetParts().IsEmpty());
}

TEST_F(ErnBuilderTest, AllComponents) {
  auto ern = ErnBuilder()
                 .UsingGenerator(generator_)
                 .WithDomain("acme")
                 .WithCategory("billing")
                 .WithAccount("acct42")
                 .WithRoot("invoice")
                 .AddPart("2024")
                 .AddPart("march")
                 .Build();
  ASSERT_TRUE(ern.has_value());
  EXPECT_EQ(ern->GetDomain().AsStringView(), "acme");
  EXPECT_EQ(ern->GetCategory().AsStringView(), "billing");
  EXPECT_EQ(ern->GetAccount().AsStringView(), "acct42");
  EXPECT_EQ(ern->GetRoot().Base(), "invoice");
  EXPECT_EQ(ern->GetParts().ToString(), "2024/march");
  EXPECT_EQ(
      ern->GetRoot().Timestamp()->time_since_epoch(),
      std::chrono::milliseconds(1'704'067'200'000));
}

TEST_F(ErnBuilderTest, GeneratorChosenAfterRootBaseIsUsed) {
  clock_->Advance(std::chrono::hours(24));
  auto ern = ErnBuilder().WithRoot("late").UsingGenerator(generator_).Build();
  ASSERT_TRUE(ern.has_value());
  EXPECT_EQ(ern->GetRoot().Base(), "late");
  EXPECT_EQ(
      ern->GetRoot().Timestamp()->time_since_epoch(),
      std::chrono::milliseconds(1'704'067'200'000) + std::chrono::hours(24));
}

TEST_F(ErnBuilderTest, LaterRootStepReplacesEarlier) {
  auto legacy = *Root::Parse("legacy");
  auto from_base = ErnBuilder()
                       .WithRoot(legacy)
                       .WithRoot("fresh")
                       .UsingGenerator(generator_)
                       .Build();
  ASSERT_TRUE(from_base.has_value());
  EXPECT_EQ(from_base->GetRoot().Base(), "fresh");

  auto from_root = ErnBuilder().WithRoot("fresh").WithRoot(legacy).Build();
  ASSERT_TRUE(from_root.has_value());
  EXPECT_EQ(from_root->GetRoot(), legacy);
}

TEST_F(ErnBuilderTest, WithPartsReplacesAddedParts) {
  std::vector<std::string> parts = {"x", "y"};
  auto ern = ErnBuilder().AddPart("a").WithParts(parts).AddPart("z").Build();
  ASSERT_TRUE(ern.has_value());
  EXPECT_EQ(ern->GetParts().ToString(), "x/y/z");
}

TEST_F(ErnBuilderTest, ExistingRootIsKept) {
  auto root = *Root::Parse("legacy");
  auto ern = ErnBuilder().WithRoot(root).Build();
  ASSERT_TRUE(ern.has_value());
  EXPECT_EQ(ern->GetRoot(), root);
}

TEST_F(ErnBuilderTest, FirstErrorIsSticky) {
  ErnBuilder builder;
  builder.WithDomain("").WithCategory("bad:category").AddPart("fine");
  ASSERT_TRUE(builder.GetError().has_value());
  EXPECT_EQ(builder.GetError()->component, "Domain");

  auto ern = builder.Build();
  ASSERT_FALSE(ern.has_value());
  EXPECT_EQ(ern.error().kind, ErrorKind::kEmptyValue);
  EXPECT_EQ(ern.error().component, "Domain");
}

TEST_F(ErnBuilderTest, StepsAfterErrorAreIgnored) {
  ErnBuilder builder;
  builder.AddPart("a/b").WithDomain("");
  EXPECT_EQ(builder.GetError()->component, "Part");
  EXPECT_EQ(builder.GetError()->kind, ErrorKind::kInvalidFormat);
}

TEST_F(ErnBuilderTest, InvalidRootBase) {
  auto ern = ErnBuilder().WithRoot("").Build();
  ASSERT_FALSE(ern.has_value());
  EXPECT_EQ(ern.error().component, "Root");
}

TEST_F(ErnBuilderTest, InvalidPartsListFailsBuild) {
  auto ern = ErnBuilder().WithParts({"ok", ""}).Build();
  ASSERT_FALSE(ern.has_value());
  EXPECT_EQ(ern.error().component, "Part");
}

TEST_F(ErnBuilderTest, EachBuildGeneratesFreshDefaultRoot) {
  ErnBuilder builder;
  builder.UsingGenerator(generator_);
  auto first = builder.Build();
  auto second = builder.Build();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_LT(*first, *second);
}

TEST_F(ErnBuilderTest, SeededFromConfig) {
  config::ErnConfig config;
  config.domain = *Domain::Create("tenant");
  config.account = *Account::Create("acct");
  config.root_base = "entity";

  auto ern = ErnBuilder(config).UsingGenerator(generator_).Build();
  ASSERT_TRUE(ern.has_value());
  EXPECT_EQ(ern->GetDomain().AsStringView(), "tenant");
  EXPECT_EQ(ern->GetCategory(), Category::Default());
  EXPECT_EQ(ern->GetAccount().AsStringView(), "acct");
  EXPECT_EQ(ern->GetRoot().Base(), "entity");
}

TEST_F(ErnBuilderTest, ExplicitValuesOverrideConfig) {
  config::ErnConfig config;
  config.domain = *Domain::Create("tenant");
  auto ern = ErnBuilder(config).WithDomain("override").Build();
  ASSERT_TRUE(ern.has_value());
  EXPECT_EQ(ern->GetDomain().AsStringView(), "override");
}

}  // namespace
}  // namespace ern
