#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "wapps/common/diagnostic.hpp"

namespace wapps::package {

// Fixed header: magic(4) | version(4, LE) | metadata length(4, LE).
inline constexpr std::array<uint8_t, 4> kMagic = {'W', 'A', 'P', 'P'};
inline constexpr uint32_t kFormatVersion = 1;
inline constexpr size_t kHeaderSize = 12;

enum class ParseErrorKind : uint8_t {
  kTruncated,
  kBadMagic,
  kUnsupportedVersion,
  kBadMetadata,
};

struct ParseError {
  ParseErrorKind kind;
  // Header field that failed validation: "header", "magic", "version",
  // "metadata_length" or "metadata".
  std::string field;
  uint32_t actual_version = 0;  // Only meaningful for kUnsupportedVersion
  std::string reason;

  [[nodiscard]] auto Message() const -> std::string;
  [[nodiscard]] auto ToDiagnostic() const -> Diagnostic;
};

// A parsed package. Immutable once produced by ParsePackage.
class Package {
 public:
  Package(uint32_t version, nlohmann::json metadata, std::vector<uint8_t> payload)
      : version_(version),
        metadata_(std::move(metadata)),
        payload_(std::move(payload)) {
  }

  [[nodiscard]] auto Version() const -> uint32_t {
    return version_;
  }

  // Always a JSON object.
  [[nodiscard]] auto Metadata() const -> const nlohmann::json& {
    return metadata_;
  }

  // Guest module bytes, untouched.
  [[nodiscard]] auto Payload() const -> std::span<const uint8_t> {
    return payload_;
  }

  // The "name" key when it holds a string (possibly empty).
  [[nodiscard]] auto Name() const -> std::optional<std::string>;

  // The "description" key when it holds a string.
  [[nodiscard]] auto Description() const -> std::optional<std::string>;

 private:
  uint32_t version_;
  nlohmann::json metadata_;
  std::vector<uint8_t> payload_;
};

using ParseResult = std::expected<Package, ParseError>;

// Decode a package from raw file bytes. Validation short-circuits on the
// first failure in this order: header size, magic, version, metadata
// length, metadata document. Pure: the payload is never inspected.
auto ParsePackage(std::span<const uint8_t> bytes) -> ParseResult;

// Encode metadata and payload into the package layout. Metadata must be a
// JSON object.
auto SerializePackage(
    const nlohmann::json& metadata, std::span<const uint8_t> payload)
    -> Result<std::vector<uint8_t>>;

// Display title: the metadata "name" when present and non-empty, otherwise
// the caller-supplied fallback.
auto ResolveTitle(const Package& package, std::string_view fallback)
    -> std::string;

// Read a whole file for ParsePackage.
auto ReadPackageFile(const std::string& path) -> Result<std::vector<uint8_t>>;

}  // namespace wapps::package
