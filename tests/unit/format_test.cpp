#include <gtest/gtest.h>

#include <string>

#include <fmt/format.h>

#include "ern/common/error.hpp"
#include "ern/format.hpp"
#include "ern/model/ern.hpp"

namespace ern {
namespace {

class FormatTest : public ::testing::Test {};

TEST_F(FormatTest, ErnFormatsCanonically) {
  auto ern = Ern::Parse("ern:d:c:a:root/x/y");
  ASSERT_TRUE(ern.has_value());
  EXPECT_EQ(fmt::format("{}", *ern), "ern:d:c:a:root/x/y");
}

TEST_F(FormatTest, ComponentsFormatRawStrings) {
  auto ern = *Ern::Parse("ern:d:c:a:root/x/y");
  EXPECT_EQ(
      fmt::format(
          "{} {} {} {} {}", ern.GetDomain(), ern.GetCategory(),
          ern.GetAccount(), ern.GetRoot(), ern.GetParts()),
      "d c a root x/y");
}

TEST_F(FormatTest, StringSpecsApply) {
  auto part = *Part::Create("ab");
  EXPECT_EQ(fmt::format("[{:>4}]", part), "[  ab]");
}

TEST_F(FormatTest, ErrorFormatsWithKind) {
  EXPECT_EQ(
      fmt::format("{}", Error::EmptyValue("Domain")),
      "empty value: Domain cannot be empty");
}

}  // namespace
}  // namespace ern
