#include "commands.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "print.hpp"
#include "wapps/common/diagnostic.hpp"
#include "wapps/package/package.hpp"
#include "wapps/package/wasm_module_info.hpp"
#include "wapps/runtime/capability_surface.hpp"
#include "wapps/runtime/guest.hpp"
#include "wapps/runtime/system_services.hpp"

namespace wapps::driver {
namespace {

namespace fs = std::filesystem;

// Packager limits, in UTF-8 bytes.
constexpr size_t kMaxNameBytes = 255;
constexpr size_t kMaxDescriptionBytes = 1023;

auto LoadPackage(const std::string& path) -> Result<package::Package> {
  auto bytes = package::ReadPackageFile(path);
  if (!bytes) {
    return std::unexpected(std::move(bytes.error()));
  }
  auto parsed = package::ParsePackage(*bytes);
  if (!parsed) {
    return std::unexpected(parsed.error().ToDiagnostic());
  }
  return std::move(*parsed);
}

void PrintModuleTables(const package::WasmModuleInfo& info) {
  fmt::print("imports:         {}\n", info.imports.size());
  for (const auto& import : info.imports) {
    fmt::print(
        "  {} {}.{}\n", package::ExternKindName(import.kind), import.module,
        import.name);
  }
  fmt::print("exports:         {}\n", info.exports.size());
  for (const auto& exp : info.exports) {
    fmt::print("  {} {}\n", package::ExternKindName(exp.kind), exp.name);
  }
}

auto ToImportRefs(const package::WasmModuleInfo& info)
    -> std::vector<runtime::ImportRef> {
  std::vector<runtime::ImportRef> refs;
  refs.reserve(info.imports.size());
  for (const auto& import : info.imports) {
    refs.push_back(
        runtime::ImportRef{
            .module = import.module,
            .name = import.name,
            .kind = import.kind,
        });
  }
  return refs;
}

// "key=value"; the value is taken as JSON when it parses, else as a string.
auto ParseMetaArgument(std::string_view arg)
    -> std::optional<std::pair<std::string, nlohmann::json>> {
  auto eq = arg.find('=');
  if (eq == std::string_view::npos || eq == 0) {
    return std::nullopt;
  }
  std::string key(arg.substr(0, eq));
  std::string raw(arg.substr(eq + 1));
  auto value = nlohmann::json::parse(raw, nullptr, false);
  if (value.is_discarded()) {
    value = raw;
  }
  return std::make_pair(std::move(key), std::move(value));
}

}  // namespace

auto InspectCommand(
    const argparse::ArgumentParser& cmd, const config::HostConfig& config)
    -> int {
  auto path = cmd.get<std::string>("file");
  auto pkg = LoadPackage(path);
  if (!pkg) {
    PrintDiagnostic(pkg.error());
    return 1;
  }

  fmt::print("file:            {}\n", path);
  fmt::print("format version:  {}\n", pkg->Version());
  fmt::print("title:           {}\n", package::ResolveTitle(*pkg, config.title));
  if (auto description = pkg->Description()) {
    fmt::print("description:     {}\n", *description);
  }
  fmt::print("metadata:        {}\n", pkg->Metadata().dump());
  fmt::print("payload:         {} bytes\n", pkg->Payload().size());

  if (!package::HasWasmMagic(pkg->Payload())) {
    PrintWarning("payload is not a WebAssembly module");
    return 0;
  }
  auto info = package::ScanWasmModule(pkg->Payload());
  if (!info) {
    PrintDiagnostic(info.error());
    return 1;
  }
  PrintModuleTables(*info);
  return 0;
}

auto CheckCommand(
    const argparse::ArgumentParser& cmd, const config::HostConfig& config)
    -> int {
  auto path = cmd.get<std::string>("file");
  auto pkg = LoadPackage(path);
  if (!pkg) {
    PrintDiagnostic(pkg.error());
    return 1;
  }

  auto info = package::ScanWasmModule(pkg->Payload());
  if (!info) {
    PrintDiagnostic(info.error());
    return 1;
  }

  auto services = config::MakeSystemServices(config);
  runtime::CapabilitySurface surface(
      *services,
      runtime::CapabilityOptions{
          .legacy_frame_import = config.legacy_frame_import});
  auto refs = ToImportRefs(*info);
  if (auto linked = surface.Link(refs); !linked) {
    PrintDiagnostic(linked.error());
    return 1;
  }

  if (!info->HasExport("memory", package::ExternKind::kMemory)) {
    PrintDiagnostic(
        Diagnostic::LinkError("guest module does not export its memory"));
    return 1;
  }

  auto exports = runtime::ExportSet::FromPredicate([&](std::string_view name) {
    return info->HasExport(name, package::ExternKind::kFunction);
  });
  if (!exports.Has(runtime::GuestExport::kUpdate)) {
    PrintDiagnostic(
        Diagnostic::LinkError("guest must export 'update(delta_seconds: f64)'"));
    return 1;
  }

  std::string handlers;
  for (size_t i = 1; i < runtime::kGuestExportCount; ++i) {
    auto entry = static_cast<runtime::GuestExport>(i);
    if (exports.Has(entry)) {
      handlers += handlers.empty() ? "" : ", ";
      handlers += runtime::GuestExportName(entry);
    }
  }
  fmt::print(
      "{}: ok, '{}' links against this host ({} imports; handlers: {})\n",
      path, package::ResolveTitle(*pkg, config.title), refs.size(),
      handlers.empty() ? "none" : handlers);
  return 0;
}

auto PackCommand(const argparse::ArgumentParser& cmd) -> int {
  fs::path module_path = cmd.get<std::string>("module");
  fs::path output_path;
  if (auto out = cmd.present<std::string>("--output")) {
    output_path = *out;
  } else {
    output_path = module_path.stem().string() + ".wapp";
  }

  std::ifstream in(module_path, std::ios::binary);
  if (!in) {
    PrintError(fmt::format("cannot open '{}'", module_path.string()));
    return 1;
  }
  std::vector<uint8_t> payload(
      (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (!package::HasWasmMagic(payload)) {
    PrintWarning(
        fmt::format(
            "'{}' does not look like a WebAssembly module",
            module_path.string()));
  }

  nlohmann::json metadata = nlohmann::json::object();
  if (auto vals = cmd.present<std::vector<std::string>>("--meta")) {
    for (const auto& arg : *vals) {
      auto entry = ParseMetaArgument(arg);
      if (!entry) {
        PrintError(fmt::format("--meta expects key=value, got '{}'", arg));
        return 1;
      }
      metadata[entry->first] = std::move(entry->second);
    }
  }
  if (auto name = cmd.present<std::string>("--name")) {
    if (name->size() > kMaxNameBytes) {
      PrintError(fmt::format("name too long (max {} bytes)", kMaxNameBytes));
      return 1;
    }
    metadata["name"] = *name;
  }
  if (auto description = cmd.present<std::string>("--description")) {
    if (description->size() > kMaxDescriptionBytes) {
      PrintError(
          fmt::format(
              "description too long (max {} bytes)", kMaxDescriptionBytes));
      return 1;
    }
    metadata["description"] = *description;
  }

  auto bytes = package::SerializePackage(metadata, payload);
  if (!bytes) {
    PrintDiagnostic(bytes.error());
    return 1;
  }

  std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
  out.write(
      reinterpret_cast<const char*>(bytes->data()),
      static_cast<std::streamsize>(bytes->size()));
  if (!out) {
    PrintError(fmt::format("failed to write '{}'", output_path.string()));
    return 1;
  }

  fmt::print(
      "Created {} ({} bytes, {} bytes of guest module)\n",
      output_path.string(), bytes->size(), payload.size());
  return 0;
}

}  // namespace wapps::driver
