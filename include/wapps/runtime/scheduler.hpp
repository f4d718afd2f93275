#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "wapps/common/diagnostic.hpp"
#include "wapps/runtime/capability_surface.hpp"
#include "wapps/runtime/frame_bridge.hpp"
#include "wapps/runtime/guest.hpp"
#include "wapps/runtime/input.hpp"
#include "wapps/runtime/presenter.hpp"
#include "wapps/runtime/session_event.hpp"
#include "wapps/runtime/system_services.hpp"

namespace wapps::runtime {

struct SchedulerOptions {
  // Upper bound for the delta passed to update(), so a stall does not turn
  // into one huge simulation step.
  double max_delta_seconds = 0.25;
  CapabilityOptions capabilities;
  SurfaceMetrics surface;
};

struct LoadedPackage {
  std::string title;
  std::optional<std::string> description;
  size_t payload_size = 0;
};

enum class TickOutcome : uint8_t {
  kNotRunning,         // No guest; nothing was called
  kPresented,          // A frame went to the presenter
  kNoFrame,            // Guest has not published a frame yet
  kPresentationError,  // Frame skipped, session continues
  kFaulted,            // Guest trapped; session is over
};

// Owns the one guest of a session and drives it one tick per display
// refresh: drain input, update(dt), present. Single-threaded; guest calls
// only ever happen inside Load() and Tick().
//
// States: Idle -> Loading -> Running -> (Faulted | Stopped). Loading a new
// package stops the current guest first; a failed load ends in Faulted.
class Scheduler {
 public:
  using Clock = std::chrono::steady_clock;

  Scheduler(
      Substrate& substrate, SystemServices& services,
      SchedulerOptions options = {});
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  auto operator=(const Scheduler&) -> Scheduler& = delete;
  Scheduler(Scheduler&&) = delete;
  auto operator=(Scheduler&&) -> Scheduler& = delete;

  // Non-owning; must outlive the scheduler or be replaced.
  void SetPresenter(Presenter* presenter) {
    presenter_ = presenter;
  }
  void AddSink(SessionSink* sink) {
    sinks_.push_back(sink);
  }

  // Parse, link and instantiate a package. Format and link failures are
  // returned here and never surface from Tick().
  auto Load(std::span<const uint8_t> bytes, std::string_view fallback_title)
      -> Result<LoadedPackage>;

  // Stop the running guest. Inside a tick this takes effect once the tick
  // completes.
  void Unload();

  // Queue an event for the next tick. Host events are translated on
  // arrival; untranslatable ones are dropped.
  void PostInput(const HostEvent& event);
  void PostInput(InputEvent event);

  auto Tick(Clock::time_point now) -> TickOutcome;

  // Tick once per presenter refresh until the guest stops or faults, or the
  // presenter asks to quit.
  auto Run(
      Presenter& presenter,
      const std::function<Clock::time_point()>& now = Clock::now)
      -> SessionState;

  [[nodiscard]] auto State() const -> SessionState {
    return state_;
  }

  [[nodiscard]] auto Title() const -> const std::string& {
    return title_;
  }

  // Trap or load failure that put the session in Faulted.
  [[nodiscard]] auto LastFault() const -> const std::optional<Diagnostic>& {
    return last_fault_;
  }

  [[nodiscard]] auto Frame() const -> std::optional<FrameDescriptor>;

  [[nodiscard]] auto PendingInput() const -> size_t {
    return input_queue_.size();
  }

 private:
  // Declaration order matters: the instance is destroyed before the module
  // it came from and the surface it is bound to.
  struct ActiveGuest {
    std::unique_ptr<CapabilitySurface> surface;
    std::unique_ptr<CompiledModule> module;
    std::unique_ptr<GuestInstance> instance;
    ExportSet exports;
    FrameBridge bridge;
  };

  auto Instantiate(std::span<const uint8_t> payload)
      -> Result<std::unique_ptr<ActiveGuest>>;
  auto FailLoad(Diagnostic diag) -> Diagnostic;
  auto RunTick(double delta_seconds) -> TickOutcome;
  auto CallGuest(GuestExport entry, const CallResult& result) -> bool;
  auto PresentFrame() -> TickOutcome;
  void Fault(GuestExport entry, const Trap& trap);
  void Stop();
  void Transition(SessionState to);
  void Emit(const SessionEvent& event);

  Substrate& substrate_;
  SystemServices& services_;
  SchedulerOptions options_;
  Presenter* presenter_ = nullptr;
  std::vector<SessionSink*> sinks_;

  SessionState state_ = SessionState::kIdle;
  std::unique_ptr<ActiveGuest> guest_;
  std::string title_;
  std::optional<Diagnostic> last_fault_;
  InputTranslator translator_;
  std::deque<InputEvent> input_queue_;
  std::optional<Clock::time_point> last_tick_;
  bool ticking_ = false;
  bool stop_requested_ = false;
};

}  // namespace wapps::runtime
