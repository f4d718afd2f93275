#include "wapps/config/host_config.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <toml++/toml.hpp>

namespace wapps::config {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

auto BadValue(std::string_view source, std::string_view key, std::string_view why)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::HostError(std::format("{}: '{}' {}", source, key, why)));
}

// Reads an optional key. A present value of the wrong type is an error
// rather than silently falling back to the default.
template <typename T>
auto ReadOptional(
    const toml::table& tbl, std::string_view section, std::string_view key,
    std::string_view source, T& out) -> Result<void> {
  auto node = tbl[section][key];
  if (!node) {
    return {};
  }
  auto value = node.template value<T>();
  if (!value) {
    return BadValue(
        source, std::format("{}.{}", section, key), "has the wrong type");
  }
  out = *value;
  return {};
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<HostConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", source_name, e.description())));
  }

  HostConfig config;
  int64_t width = config.width;
  int64_t height = config.height;

  for (auto result : {
           ReadOptional(tbl, "window", "title", source_name, config.title),
           ReadOptional(tbl, "window", "width", source_name, width),
           ReadOptional(tbl, "window", "height", source_name, height),
           ReadOptional(
               tbl, "scheduler", "max_delta_seconds", source_name,
               config.max_delta_seconds),
           ReadOptional(tbl, "log", "level", source_name, config.log_level),
           ReadOptional(
               tbl, "guest", "console", source_name, config.guest_console),
           ReadOptional(
               tbl, "guest", "legacy_frame_import", source_name,
               config.legacy_frame_import),
       }) {
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }
  }

  if (width <= 0 || width > 65535) {
    return BadValue(source_name, "window.width", "must be in 1..65535");
  }
  if (height <= 0 || height > 65535) {
    return BadValue(source_name, "window.height", "must be in 1..65535");
  }
  config.width = static_cast<int>(width);
  config.height = static_cast<int>(height);

  if (!(config.max_delta_seconds > 0.0)) {
    return BadValue(
        source_name, "scheduler.max_delta_seconds", "must be positive");
  }
  if (std::ranges::find(kLogLevels, config.log_level) == kLogLevels.end()) {
    return BadValue(
        source_name, "log.level",
        "must be one of trace, debug, info, warn, error, critical, off");
  }

  return config;
}

auto LoadConfig(const fs::path& config_path) -> Result<HostConfig> {
  std::ifstream in(config_path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open {}", config_path.string())));
  }
  std::string text(
      (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  return ParseConfig(text, config_path.string());
}

auto ToSchedulerOptions(const HostConfig& config) -> runtime::SchedulerOptions {
  runtime::SchedulerOptions options;
  options.max_delta_seconds = config.max_delta_seconds;
  options.capabilities.legacy_frame_import = config.legacy_frame_import;
  options.surface = runtime::SurfaceMetrics{
      .logical_width = static_cast<double>(config.width),
      .logical_height = static_cast<double>(config.height),
      .backing_width = config.width,
      .backing_height = config.height,
  };
  return options;
}

auto MakeSystemServices(const HostConfig& config)
    -> std::unique_ptr<runtime::HostSystemServices> {
  return std::make_unique<runtime::HostSystemServices>(config.guest_console);
}

}  // namespace wapps::config
