#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace wapps::common {

// Exception type for host bugs (broken internal preconditions), never for
// malformed packages or misbehaving guests.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format("internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace wapps::common
