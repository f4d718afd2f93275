#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "commands.hpp"
#include "logging.hpp"
#include "print.hpp"
#include "wapps/config/host_config.hpp"

namespace {

namespace fs = std::filesystem;

auto LoadOptionalConfig() -> wapps::Result<wapps::config::HostConfig> {
  auto config_path = wapps::config::FindConfig();
  if (!config_path) {
    return wapps::config::HostConfig{};
  }
  return wapps::config::LoadConfig(*config_path);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("wapps", "0.1.0");
  program.add_description("Inspect, validate and build WAPP packages");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");

  // Subcommand: inspect
  argparse::ArgumentParser inspect_cmd("inspect");
  inspect_cmd.add_description(
      "Print package header, metadata and module tables");
  inspect_cmd.add_argument("file").help("Package file (.wapp)");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description(
      "Validate a package and link its guest against the host imports");
  check_cmd.add_argument("file").help("Package file (.wapp)");

  // Subcommand: pack
  argparse::ArgumentParser pack_cmd("pack");
  pack_cmd.add_description("Build a package from a WebAssembly module");
  pack_cmd.add_argument("module").help("Guest module (.wasm)");
  pack_cmd.add_argument("-o", "--output").help(
      "Output path (default: <module>.wapp)");
  pack_cmd.add_argument("--name").help("Display title");
  pack_cmd.add_argument("--description").help("Short description");
  pack_cmd.add_argument("--meta").append().help(
      "Extra metadata key=value (repeatable)");

  program.add_subparser(inspect_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(pack_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    wapps::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      wapps::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  auto config = LoadOptionalConfig();
  if (!config) {
    wapps::driver::PrintDiagnostic(config.error());
    return 1;
  }
  wapps::driver::InitLogging(
      program.get<bool>("--verbose") ? "debug" : config->log_level);

  if (program.is_subcommand_used("inspect")) {
    return wapps::driver::InspectCommand(inspect_cmd, *config);
  }

  if (program.is_subcommand_used("check")) {
    return wapps::driver::CheckCommand(check_cmd, *config);
  }

  if (program.is_subcommand_used("pack")) {
    return wapps::driver::PackCommand(pack_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
