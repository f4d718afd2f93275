#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "wapps/common/diagnostic.hpp"
#include "wapps/runtime/scheduler.hpp"
#include "wapps/runtime/system_services.hpp"

namespace wapps::config {

inline constexpr std::string_view kConfigFileName = "wapps.toml";

struct HostConfig {
  // [window]
  std::string title = "WAPPS";
  int width = 800;
  int height = 600;

  // [scheduler]
  double max_delta_seconds = 0.25;

  // [log]
  std::string log_level = "info";

  // [guest]
  bool guest_console = true;
  bool legacy_frame_import = true;
};

// Search for wapps.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

auto LoadConfig(const std::filesystem::path& config_path) -> Result<HostConfig>;

// Parse TOML text; source_name only appears in messages.
auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<HostConfig>;

auto ToSchedulerOptions(const HostConfig& config) -> runtime::SchedulerOptions;

// Host services for a session; guest console output is dropped when
// [guest] console is false.
auto MakeSystemServices(const HostConfig& config)
    -> std::unique_ptr<runtime::HostSystemServices>;

}  // namespace wapps::config
