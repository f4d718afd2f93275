#include "wapps/runtime/scheduler.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "wapps/common/internal_error.hpp"
#include "wapps/package/package.hpp"

namespace wapps::runtime {

namespace {

// Marks the span of a tick so Unload() can defer to its end.
class TickScope {
 public:
  explicit TickScope(bool& ticking) : ticking_(ticking) {
    ticking_ = true;
  }
  ~TickScope() {
    ticking_ = false;
  }

  TickScope(const TickScope&) = delete;
  auto operator=(const TickScope&) -> TickScope& = delete;
  TickScope(TickScope&&) = delete;
  auto operator=(TickScope&&) -> TickScope& = delete;

 private:
  bool& ticking_;
};

// Runs its callback when a load leaves scope, including by exception.
class LoadScope {
 public:
  explicit LoadScope(std::function<void()> on_exit)
      : on_exit_(std::move(on_exit)) {
  }
  ~LoadScope() {
    on_exit_();
  }

  LoadScope(const LoadScope&) = delete;
  auto operator=(const LoadScope&) -> LoadScope& = delete;
  LoadScope(LoadScope&&) = delete;
  auto operator=(LoadScope&&) -> LoadScope& = delete;

 private:
  std::function<void()> on_exit_;
};

}  // namespace

auto SessionStateName(SessionState state) -> std::string_view {
  switch (state) {
    case SessionState::kIdle:
      return "idle";
    case SessionState::kLoading:
      return "loading";
    case SessionState::kRunning:
      return "running";
    case SessionState::kFaulted:
      return "faulted";
    case SessionState::kStopped:
      return "stopped";
  }
  return "unknown";
}

Scheduler::Scheduler(
    Substrate& substrate, SystemServices& services, SchedulerOptions options)
    : substrate_(substrate),
      services_(services),
      options_(options),
      translator_(options.surface) {
}

Scheduler::~Scheduler() = default;

auto Scheduler::Load(
    std::span<const uint8_t> bytes, std::string_view fallback_title)
    -> Result<LoadedPackage> {
  if (state_ == SessionState::kLoading || ticking_) {
    common::ThrowInternalError(
        "Scheduler::Load", "load requested while a load or tick is running");
  }

  if (guest_ != nullptr) {
    Stop();
  }
  last_fault_.reset();
  Transition(SessionState::kLoading);

  // Every return sets Running or Faulted; only an exception leaves Loading.
  LoadScope scope([this] {
    if (state_ == SessionState::kLoading) {
      guest_.reset();
      last_fault_ = Diagnostic::HostError("load aborted by an exception");
      Transition(SessionState::kFaulted);
    }
  });

  auto package = package::ParsePackage(bytes);
  if (!package) {
    return std::unexpected(FailLoad(package.error().ToDiagnostic()));
  }

  auto guest = Instantiate(package->Payload());
  if (!guest) {
    return std::unexpected(FailLoad(std::move(guest.error())));
  }

  guest_ = std::move(*guest);
  title_ = package::ResolveTitle(*package, fallback_title);
  input_queue_.clear();
  last_tick_.reset();
  stop_requested_ = false;

  if (presenter_ != nullptr) {
    presenter_->SetTitle(title_);
  }
  Transition(SessionState::kRunning);
  spdlog::info(
      "loaded '{}' ({} bytes of guest module)", title_,
      package->Payload().size());

  return LoadedPackage{
      .title = title_,
      .description = package->Description(),
      .payload_size = package->Payload().size(),
  };
}

auto Scheduler::Instantiate(std::span<const uint8_t> payload)
    -> Result<std::unique_ptr<ActiveGuest>> {
  auto guest = std::make_unique<ActiveGuest>();

  spdlog::debug("compiling guest module...");
  auto module = substrate_.Compile(payload);
  if (!module) {
    return std::unexpected(std::move(module.error()));
  }
  guest->module = std::move(*module);

  guest->surface =
      std::make_unique<CapabilitySurface>(services_, options_.capabilities);
  if (auto linked = guest->surface->Link(guest->module->Imports()); !linked) {
    return std::unexpected(std::move(linked.error()));
  }

  spdlog::debug("instantiating guest module...");
  auto instance = guest->module->Instantiate(*guest->surface);
  if (!instance) {
    return std::unexpected(std::move(instance.error()));
  }
  guest->instance = std::move(*instance);
  // Start code ran; memory may already have grown.
  guest->surface->NoteGuestCall();

  if (guest->instance->Memory() == nullptr) {
    return std::unexpected(
        Diagnostic::LinkError("guest module has no linear memory"));
  }

  guest->exports = ExportSet::Discover(*guest->instance);
  if (!guest->exports.Has(GuestExport::kUpdate)) {
    return std::unexpected(
        Diagnostic::LinkError(
            "guest must export 'update(delta_seconds: f64)'"));
  }
  return guest;
}

auto Scheduler::FailLoad(Diagnostic diag) -> Diagnostic {
  spdlog::error("load failed: {}", FormatDiagnostic(diag));
  guest_.reset();
  last_fault_ = diag;
  Transition(SessionState::kFaulted);
  return diag;
}

void Scheduler::Unload() {
  if (ticking_) {
    stop_requested_ = true;
    return;
  }
  if (state_ == SessionState::kRunning) {
    Stop();
  }
}

void Scheduler::PostInput(const HostEvent& event) {
  auto translated = translator_.Translate(event);
  if (!translated) {
    spdlog::trace("dropped host input with no guest mapping");
    return;
  }
  PostInput(std::move(*translated));
}

void Scheduler::PostInput(InputEvent event) {
  if (state_ != SessionState::kRunning) {
    return;
  }
  input_queue_.push_back(std::move(event));
}

auto Scheduler::Tick(Clock::time_point now) -> TickOutcome {
  if (stop_requested_) {
    stop_requested_ = false;
    Unload();
  }
  if (state_ != SessionState::kRunning || guest_ == nullptr) {
    return TickOutcome::kNotRunning;
  }

  double delta = 0.0;
  if (last_tick_) {
    delta = std::chrono::duration<double>(now - *last_tick_).count();
    delta = std::clamp(delta, 0.0, options_.max_delta_seconds);
  }
  last_tick_ = now;

  TickOutcome outcome = TickOutcome::kNotRunning;
  {
    TickScope scope(ticking_);
    outcome = RunTick(delta);
  }

  if (stop_requested_) {
    stop_requested_ = false;
    Unload();
  }
  return outcome;
}

auto Scheduler::RunTick(double delta_seconds) -> TickOutcome {
  std::deque<InputEvent> events;
  events.swap(input_queue_);
  for (const auto& event : events) {
    auto result = Dispatch(*guest_->instance, guest_->exports, event);
    if (!CallGuest(EntryPointFor(event), result)) {
      return TickOutcome::kFaulted;
    }
  }

  std::array<GuestValue, 1> args = {delta_seconds};
  auto result =
      guest_->instance->Call(GuestExportName(GuestExport::kUpdate), args);
  if (!CallGuest(GuestExport::kUpdate, result)) {
    return TickOutcome::kFaulted;
  }

  return PresentFrame();
}

auto Scheduler::CallGuest(GuestExport entry, const CallResult& result) -> bool {
  guest_->surface->NoteGuestCall();
  if (!result) {
    Fault(entry, result.error());
    return false;
  }
  return true;
}

auto Scheduler::PresentFrame() -> TickOutcome {
  GuestMemory* memory = guest_->instance->Memory();
  if (memory == nullptr) {
    common::ThrowInternalError(
        "Scheduler::PresentFrame", "guest instance lost its memory");
  }

  auto presented = guest_->bridge.Present(*memory, guest_->surface->Frame());
  if (!presented) {
    spdlog::warn("frame skipped: {}", presented.error().Message());
    Emit(PresentationFailed{.error = presented.error()});
    return TickOutcome::kPresentationError;
  }
  if (!presented->has_value()) {
    return TickOutcome::kNoFrame;
  }
  if (presenter_ != nullptr) {
    presenter_->Present(**presented);
  }
  return TickOutcome::kPresented;
}

void Scheduler::Fault(GuestExport entry, const Trap& trap) {
  auto diag = Diagnostic::Trap(
      fmt::format(
          "guest trapped in '{}': {}", GuestExportName(entry), trap.reason));
  spdlog::error("{}", diag.primary.message);
  last_fault_ = diag;
  guest_.reset();
  input_queue_.clear();
  last_tick_.reset();
  Transition(SessionState::kFaulted);
  Emit(GuestTrapped{.entry_point = entry, .reason = trap.reason});
}

void Scheduler::Stop() {
  guest_.reset();
  input_queue_.clear();
  last_tick_.reset();
  if (state_ == SessionState::kRunning) {
    Transition(SessionState::kStopped);
    spdlog::info("guest '{}' stopped", title_);
  }
}

auto Scheduler::Run(
    Presenter& presenter, const std::function<Clock::time_point()>& now)
    -> SessionState {
  SetPresenter(&presenter);
  if (state_ == SessionState::kRunning) {
    presenter.SetTitle(title_);
  }
  while (state_ == SessionState::kRunning && presenter.WaitForRefresh()) {
    Tick(now());
  }
  return state_;
}

auto Scheduler::Frame() const -> std::optional<FrameDescriptor> {
  if (guest_ == nullptr) {
    return std::nullopt;
  }
  return guest_->surface->Frame();
}

void Scheduler::Transition(SessionState to) {
  SessionState from = state_;
  state_ = to;
  spdlog::debug(
      "session: {} -> {}", SessionStateName(from), SessionStateName(to));
  Emit(StateChanged{.from = from, .to = to});
}

void Scheduler::Emit(const SessionEvent& event) {
  for (auto* sink : sinks_) {
    sink->OnEvent(event);
  }
}

}  // namespace wapps::runtime
