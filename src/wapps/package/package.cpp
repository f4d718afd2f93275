#include "wapps/package/package.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "wapps/common/byte_order.hpp"

namespace wapps::package {

namespace {

auto Fail(ParseErrorKind kind, std::string field, std::string reason)
    -> std::unexpected<ParseError> {
  return std::unexpected(
      ParseError{
          .kind = kind,
          .field = std::move(field),
          .actual_version = 0,
          .reason = std::move(reason),
      });
}

// Returns the offset of the first byte that breaks UTF-8 well-formedness,
// or nullopt if the whole range is valid. Rejects overlongs, surrogates and
// code points above U+10FFFF.
auto FindInvalidUtf8(std::span<const uint8_t> text) -> std::optional<size_t> {
  size_t i = 0;
  while (i < text.size()) {
    uint8_t lead = text[i];
    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t length = 0;
    uint32_t min_code_point = 0;
    uint32_t code_point = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      min_code_point = 0x80;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      min_code_point = 0x800;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      min_code_point = 0x10000;
      code_point = lead & 0x07;
    } else {
      return i;
    }

    if (i + length > text.size()) {
      return i;
    }
    for (size_t k = 1; k < length; ++k) {
      uint8_t cont = text[i + k];
      if ((cont & 0xC0) != 0x80) {
        return i;
      }
      code_point = (code_point << 6) | (cont & 0x3F);
    }
    if (code_point < min_code_point || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return i;
    }
    i += length;
  }
  return std::nullopt;
}

auto JsonTypeName(const nlohmann::json& value) -> std::string {
  return value.type_name();
}

auto StringKey(const nlohmann::json& metadata, const char* key)
    -> std::optional<std::string> {
  auto it = metadata.find(key);
  if (it == metadata.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

}  // namespace

auto ParseError::Message() const -> std::string {
  switch (kind) {
    case ParseErrorKind::kTruncated:
      return fmt::format("truncated package ({}): {}", field, reason);
    case ParseErrorKind::kBadMagic:
      return fmt::format("not a WAPP package ({}): {}", field, reason);
    case ParseErrorKind::kUnsupportedVersion:
      return fmt::format(
          "unsupported package version {} (this host supports version {})",
          actual_version, kFormatVersion);
    case ParseErrorKind::kBadMetadata:
      return fmt::format("malformed package metadata: {}", reason);
  }
  return reason;
}

auto ParseError::ToDiagnostic() const -> Diagnostic {
  return Diagnostic::FormatError(Message()).WithNote(
      fmt::format("offending field: {}", field));
}

auto Package::Name() const -> std::optional<std::string> {
  return StringKey(metadata_, "name");
}

auto Package::Description() const -> std::optional<std::string> {
  return StringKey(metadata_, "description");
}

auto ParsePackage(std::span<const uint8_t> bytes) -> ParseResult {
  if (bytes.size() < kHeaderSize) {
    return Fail(
        ParseErrorKind::kTruncated, "header",
        fmt::format(
            "{} bytes, the fixed header alone needs {}", bytes.size(),
            kHeaderSize));
  }

  if (!std::equal(kMagic.begin(), kMagic.end(), bytes.begin())) {
    return Fail(
        ParseErrorKind::kBadMagic, "magic",
        fmt::format(
            "expected 57 41 50 50 ('WAPP'), got {:02X} {:02X} {:02X} {:02X}",
            bytes[0], bytes[1], bytes[2], bytes[3]));
  }

  uint32_t version = common::LoadLittleEndian32(bytes, 4);
  if (version != kFormatVersion) {
    return std::unexpected(
        ParseError{
            .kind = ParseErrorKind::kUnsupportedVersion,
            .field = "version",
            .actual_version = version,
            .reason = fmt::format("version {}", version),
        });
  }

  uint64_t metadata_length = common::LoadLittleEndian32(bytes, 8);
  if (kHeaderSize + metadata_length > bytes.size()) {
    return Fail(
        ParseErrorKind::kTruncated, "metadata_length",
        fmt::format(
            "metadata declares {} bytes but only {} follow the header",
            metadata_length, bytes.size() - kHeaderSize));
  }

  auto metadata_bytes = bytes.subspan(kHeaderSize, metadata_length);
  if (auto bad = FindInvalidUtf8(metadata_bytes)) {
    return Fail(
        ParseErrorKind::kBadMetadata, "metadata",
        fmt::format("invalid UTF-8 at metadata byte {}", *bad));
  }
  if (metadata_bytes.empty()) {
    return Fail(
        ParseErrorKind::kBadMetadata, "metadata", "empty metadata document");
  }

  nlohmann::json metadata;
  try {
    metadata = nlohmann::json::parse(metadata_bytes.begin(), metadata_bytes.end());
  } catch (const nlohmann::json::parse_error& e) {
    return Fail(ParseErrorKind::kBadMetadata, "metadata", e.what());
  }
  if (!metadata.is_object()) {
    return Fail(
        ParseErrorKind::kBadMetadata, "metadata",
        fmt::format(
            "top-level value must be an object, got {}",
            JsonTypeName(metadata)));
  }

  auto payload = bytes.subspan(kHeaderSize + metadata_length);
  spdlog::debug(
      "parsed package: {} bytes, version {}, {} metadata bytes, {} payload "
      "bytes",
      bytes.size(), version, metadata_length, payload.size());

  return Package(
      version, std::move(metadata),
      std::vector<uint8_t>(payload.begin(), payload.end()));
}

auto SerializePackage(
    const nlohmann::json& metadata, std::span<const uint8_t> payload)
    -> Result<std::vector<uint8_t>> {
  if (!metadata.is_object()) {
    return std::unexpected(
        Diagnostic::FormatError(
            fmt::format(
                "package metadata must be a JSON object, got {}",
                JsonTypeName(metadata))));
  }

  std::string text = metadata.dump();
  if (text.size() > std::numeric_limits<uint32_t>::max()) {
    return std::unexpected(
        Diagnostic::FormatError(
            fmt::format("metadata too large ({} bytes)", text.size())));
  }

  std::vector<uint8_t> out;
  out.reserve(kHeaderSize + text.size() + payload.size());
  out.insert(out.end(), kMagic.begin(), kMagic.end());
  common::AppendLittleEndian32(out, kFormatVersion);
  common::AppendLittleEndian32(out, static_cast<uint32_t>(text.size()));
  out.insert(out.end(), text.begin(), text.end());
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

auto ResolveTitle(const Package& package, std::string_view fallback)
    -> std::string {
  auto name = package.Name();
  if (name && !name->empty()) {
    return *name;
  }
  return std::string(fallback);
}

auto ReadPackageFile(const std::string& path) -> Result<std::vector<uint8_t>> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("cannot open '{}'", path)));
  }
  std::vector<uint8_t> bytes(
      (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("failed to read '{}'", path)));
  }
  spdlog::debug("read {} bytes from {}", bytes.size(), path);
  return bytes;
}

}  // namespace wapps::package
