#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

#include "ern/model/root.hpp"
#include "ern/model/segment.hpp"

namespace ern::config {

inline constexpr std::string_view kConfigFileName = "ern.toml";

// Project-wide defaults for building ERNs, loaded from ern.toml.
// Every field is optional in the file; missing fields keep the built-in
// defaults.
struct ErnConfig {
  Domain domain = Domain::Default();
  Category category = Category::Default();
  Account account = Account::Default();
  // Base name for generated roots when none is given
  std::string root_base = std::string(Root::kDefaultBase);
  spdlog::level::level_enum log_level = spdlog::level::info;

  // Directory where ern.toml was found (empty for built-in defaults)
  std::filesystem::path root_dir;
};

// Search for ern.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse ern.toml
// Throws ErnException on parse errors or invalid values
auto LoadConfig(const std::filesystem::path& config_path) -> ErnConfig;

// Set the spdlog level from the config
void ApplyLogLevel(const ErnConfig& config);

}  // namespace ern::config
