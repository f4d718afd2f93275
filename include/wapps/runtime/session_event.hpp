#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "wapps/runtime/frame_bridge.hpp"
#include "wapps/runtime/guest.hpp"

namespace wapps::runtime {

enum class SessionState : uint8_t {
  kIdle,
  kLoading,
  kRunning,
  kFaulted,
  kStopped,
};

auto SessionStateName(SessionState state) -> std::string_view;

struct StateChanged {
  SessionState from;
  SessionState to;
};

// Emitted once per trap, after the instance has been released.
struct GuestTrapped {
  GuestExport entry_point;
  std::string reason;
};

// Emitted once per skipped frame; the session keeps running.
struct PresentationFailed {
  PresentationError error;
};

using SessionEvent =
    std::variant<StateChanged, GuestTrapped, PresentationFailed>;

class SessionSink {
 public:
  virtual ~SessionSink() = default;
  virtual void OnEvent(const SessionEvent& event) = 0;
};

}  // namespace wapps::runtime
