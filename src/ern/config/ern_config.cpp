#include "ern/config/ern_config.hpp"

#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "ern/common/error.hpp"
#include "ern/model/segment.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace ern::config {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kComponent = "Config";

[[noreturn]] void ThrowConfigError(std::string detail) {
  throw ErnException(Error::InvalidFormat(kComponent, std::move(detail)));
}

// Read an optional string field; a present non-string value is an error.
auto ReadString(
    const toml::node_view<toml::node>& table, std::string_view key,
    const fs::path& config_path) -> std::optional<std::string> {
  auto node = table[key];
  if (!node) {
    return std::nullopt;
  }
  auto value = node.value<std::string>();
  if (!value) {
    ThrowConfigError(
        std::format(
            "{}: field '{}' must be a string", config_path.string(), key));
  }
  return value;
}

// Validate a configured default with the component's own rules, so an
// invalid file can never seed an invalid ERN.
template <typename SegmentT>
auto ReadSegment(
    const toml::node_view<toml::node>& defaults, std::string_view key,
    const fs::path& config_path) -> std::optional<SegmentT> {
  auto text = ReadString(defaults, key, config_path);
  if (!text) {
    return std::nullopt;
  }
  auto segment = SegmentT::Create(*text);
  if (!segment) {
    auto error = std::move(segment).error();
    error.message = std::format("{}: {}", config_path.string(), error.message);
    throw ErnException(std::move(error));
  }
  return *std::move(segment);
}

auto ParseLogLevel(std::string_view text, const fs::path& config_path)
    -> spdlog::level::level_enum {
  auto level = spdlog::level::from_str(std::string(text));
  // from_str maps unknown names to off
  if (level == spdlog::level::off && text != "off") {
    ThrowConfigError(
        std::format(
            "{}: unknown log level '{}'", config_path.string(), text));
  }
  return level;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  for (auto dir = fs::absolute(start_dir);; dir = dir.parent_path()) {
    if (auto candidate = dir / kConfigFileName; fs::exists(candidate)) {
      return candidate;
    }
    if (!dir.has_relative_path()) {
      return std::nullopt;
    }
  }
}

auto LoadConfig(const fs::path& config_path) -> ErnConfig {
  ErnConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    ThrowConfigError(
        std::format("failed to parse {}: {}", config_path.string(), e.what()));
  }

  // [defaults] section (optional)
  if (auto defaults = tbl["defaults"]) {
    if (!defaults.is_table()) {
      ThrowConfigError(
          std::format("{}: 'defaults' must be a table", config_path.string()));
    }
    if (auto domain = ReadSegment<Domain>(defaults, "domain", config_path)) {
      config.domain = *std::move(domain);
    }
    if (auto category =
            ReadSegment<Category>(defaults, "category", config_path)) {
      config.category = *std::move(category);
    }
    if (auto account = ReadSegment<Account>(defaults, "account", config_path)) {
      config.account = *std::move(account);
    }
    if (auto root = ReadString(defaults, "root", config_path)) {
      if (auto valid = detail::ValidateSegment("Root", *root); !valid) {
        auto error = std::move(valid).error();
        error.message =
            std::format("{}: {}", config_path.string(), error.message);
        throw ErnException(std::move(error));
      }
      config.root_base = *std::move(root);
    }
  }

  // [log] section (optional)
  if (auto log_table = tbl["log"]) {
    if (!log_table.is_table()) {
      ThrowConfigError(
          std::format("{}: 'log' must be a table", config_path.string()));
    }
    if (auto level = ReadString(log_table, "level", config_path)) {
      config.log_level = ParseLogLevel(*level, config_path);
    }
  }

  spdlog::info("ern: loaded config {}", config_path.string());
  return config;
}

void ApplyLogLevel(const ErnConfig& config) {
  spdlog::set_level(config.log_level);
}

}  // namespace ern::config
