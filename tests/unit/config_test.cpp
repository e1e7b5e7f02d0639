#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

#include "ern/common/error.hpp"
#include "ern/config/ern_config.hpp"
#include "ern/model/segment.hpp"

namespace ern::config {
namespace {

auto GenerateRandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

// Each test gets its own temporary directory for ern.toml files.
class ErnConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() /
                ("ern_config_test_" + GenerateRandomSuffix());
    std::filesystem::create_directories(test_dir_);
  }

  void TearDown() override {
    if (!test_dir_.empty() && std::filesystem::exists(test_dir_)) {
      std::filesystem::remove_all(test_dir_);
    }
    spdlog::set_level(spdlog::level::info);
  }

  auto WriteConfig(const std::string& content) -> std::filesystem::path {
    auto path = test_dir_ / kConfigFileName;
    std::ofstream out(path);
    out << content;
    return path;
  }

  // Load, expecting failure; returns the carried error.
  auto LoadExpectingError(const std::string& content) -> Error {
    auto path = WriteConfig(content);
    try {
      (void)LoadConfig(path);
    } catch (const ErnException& e) {
      return e.GetError();
    }
    ADD_FAILURE() << "expected ErnException";
    return Error::EmptyValue("none");
  }

  std::filesystem::path test_dir_;
};

// =============================================================================
// Loading
// =============================================================================

TEST_F(ErnConfigTest, EmptyFileKeepsBuiltInDefaults) {
  auto config = LoadConfig(WriteConfig(""));
  EXPECT_EQ(config.domain, Domain::Default());
  EXPECT_EQ(config.category, Category::Default());
  EXPECT_EQ(config.account, Account::Default());
  EXPECT_EQ(config.root_base, "root");
  EXPECT_EQ(config.log_level, spdlog::level::info);
  EXPECT_EQ(config.root_dir, test_dir_);
}

TEST_F(ErnConfigTest, LoadsAllFields) {
  auto config = LoadConfig(WriteConfig(R"(
[defaults]
domain = "tenant-a"
category = "storage"
account = "acct-9"
root = "bucket"

[log]
level = "debug"
)"));
  EXPECT_EQ(config.domain.AsStringView(), "tenant-a");
  EXPECT_EQ(config.category.AsStringView(), "storage");
  EXPECT_EQ(config.account.AsStringView(), "acct-9");
  EXPECT_EQ(config.root_base, "bucket");
  EXPECT_EQ(config.log_level, spdlog::level::debug);
}

TEST_F(ErnConfigTest, PartialDefaults) {
  auto config = LoadConfig(WriteConfig("[defaults]\naccount = \"only\"\n"));
  EXPECT_EQ(config.domain, Domain::Default());
  EXPECT_EQ(config.account.AsStringView(), "only");
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(ErnConfigTest, SyntaxErrorIsConfigError) {
  auto error = LoadExpectingError("[defaults\n");
  EXPECT_EQ(error.component, "Config");
  EXPECT_EQ(error.kind, ErrorKind::kInvalidFormat);
  EXPECT_NE(error.message.find("failed to parse"), std::string::npos);
}

TEST_F(ErnConfigTest, NonStringFieldIsConfigError) {
  auto error = LoadExpectingError("[defaults]\ndomain = 42\n");
  EXPECT_EQ(error.component, "Config");
  EXPECT_NE(error.message.find("'domain' must be a string"), std::string::npos);
}

TEST_F(ErnConfigTest, DefaultsMustBeTable) {
  auto error = LoadExpectingError("defaults = \"x\"\n");
  EXPECT_EQ(error.component, "Config");
}

TEST_F(ErnConfigTest, LogMustBeTable) {
  auto error = LoadExpectingError("log = \"debug\"\n");
  EXPECT_EQ(error.component, "Config");
  EXPECT_NE(error.message.find("'log' must be a table"), std::string::npos);
}

TEST_F(ErnConfigTest, FindConfigFromConfigDirectoryItself) {
  auto path = WriteConfig("");
  auto found = FindConfig(test_dir_);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(
      std::filesystem::canonical(*found), std::filesystem::canonical(path));
}

TEST_F(ErnConfigTest, InvalidSegmentReportsComponent) {
  auto error = LoadExpectingError("[defaults]\ncategory = \"a:b\"\n");
  EXPECT_EQ(error.component, "Category");
  EXPECT_EQ(error.kind, ErrorKind::kInvalidFormat);
  EXPECT_NE(error.message.find("ern.toml"), std::string::npos);
}

TEST_F(ErnConfigTest, EmptyRootBaseRejected) {
  auto error = LoadExpectingError("[defaults]\nroot = \"\"\n");
  EXPECT_EQ(error.component, "Root");
  EXPECT_EQ(error.kind, ErrorKind::kEmptyValue);
}

TEST_F(ErnConfigTest, UnknownLogLevelRejected) {
  auto error = LoadExpectingError("[log]\nlevel = \"chatty\"\n");
  EXPECT_EQ(error.component, "Config");
  EXPECT_NE(error.message.find("chatty"), std::string::npos);
}

TEST_F(ErnConfigTest, OffLogLevelAccepted) {
  auto config = LoadConfig(WriteConfig("[log]\nlevel = \"off\"\n"));
  EXPECT_EQ(config.log_level, spdlog::level::off);
}

// =============================================================================
// Discovery and logging
// =============================================================================

TEST_F(ErnConfigTest, FindConfigSearchesParents) {
  auto path = WriteConfig("");
  auto nested = test_dir_ / "a" / "b";
  std::filesystem::create_directories(nested);

  auto found = FindConfig(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(
      std::filesystem::canonical(*found), std::filesystem::canonical(path));
}

TEST_F(ErnConfigTest, ApplyLogLevelSetsSpdlogLevel) {
  ErnConfig config;
  config.log_level = spdlog::level::warn;
  ApplyLogLevel(config);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}

}  // namespace
}  // namespace ern::config
