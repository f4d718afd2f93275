#include "wapps/runtime/system_services.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <memory>
#include <span>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace wapps::runtime {

namespace {

constexpr const char* kGuestLoggerName = "guest";

auto GuestLogger() -> std::shared_ptr<spdlog::logger> {
  if (auto existing = spdlog::get(kGuestLoggerName)) {
    return existing;
  }
  auto logger = spdlog::stderr_color_mt(kGuestLoggerName);
  logger->set_pattern("[guest][%H:%M:%S][%l] %v");
  return logger;
}

template <typename Clock>
auto SinceEpoch() -> uint64_t {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          Clock::now().time_since_epoch())
          .count());
}

auto CpuTimeNanoseconds(clockid_t id) -> uint64_t {
  timespec ts{};
  if (clock_gettime(id, &ts) != 0) {
    return 0;
  }
  return (static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL) +
         static_cast<uint64_t>(ts.tv_nsec);
}

}  // namespace

HostSystemServices::HostSystemServices(bool forward_console)
    : forward_console_(forward_console), logger_(GuestLogger()) {
}

HostSystemServices::~HostSystemServices() {
  FlushConsole();
}

auto HostSystemServices::NowNanoseconds(ClockId clock) -> uint64_t {
  switch (clock) {
    case ClockId::kRealtime:
      return SinceEpoch<std::chrono::system_clock>();
    case ClockId::kMonotonic:
      return SinceEpoch<std::chrono::steady_clock>();
    case ClockId::kProcessCpuTime:
      return CpuTimeNanoseconds(CLOCK_PROCESS_CPUTIME_ID);
    case ClockId::kThreadCpuTime:
      return CpuTimeNanoseconds(CLOCK_THREAD_CPUTIME_ID);
  }
  return 0;
}

auto HostSystemServices::ResolutionNanoseconds(ClockId clock) -> uint64_t {
  switch (clock) {
    case ClockId::kRealtime:
      return static_cast<uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(
              std::chrono::system_clock::duration(1))
              .count());
    case ClockId::kMonotonic:
      return static_cast<uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(
              std::chrono::steady_clock::duration(1))
              .count());
    case ClockId::kProcessCpuTime:
    case ClockId::kThreadCpuTime:
      return 1000;
  }
  return 1;
}

void HostSystemServices::FillRandom(std::span<uint8_t> out) {
  size_t i = 0;
  while (i < out.size()) {
    auto word = entropy_();
    for (size_t k = 0; k < sizeof(word) && i < out.size(); ++k, ++i) {
      out[i] = static_cast<uint8_t>(word >> (8 * k));
    }
  }
}

void HostSystemServices::WriteConsole(
    ConsoleStream stream, std::string_view text) {
  if (!forward_console_) {
    return;
  }
  auto& pending = pending_[static_cast<size_t>(stream)];
  pending.append(text);

  size_t start = 0;
  size_t newline = pending.find('\n', start);
  while (newline != std::string::npos) {
    EmitLine(stream, std::string_view(pending).substr(start, newline - start));
    start = newline + 1;
    newline = pending.find('\n', start);
  }
  pending.erase(0, start);

  // A guest that never writes a newline still gets its text out, in
  // pieces of at most kMaxPendingConsoleBytes.
  while (pending.size() >= kMaxPendingConsoleBytes) {
    EmitLine(
        stream, std::string_view(pending).substr(0, kMaxPendingConsoleBytes));
    pending.erase(0, kMaxPendingConsoleBytes);
  }
}

void HostSystemServices::FlushConsole() {
  for (size_t i = 0; i < pending_.size(); ++i) {
    if (!pending_[i].empty()) {
      EmitLine(static_cast<ConsoleStream>(i), pending_[i]);
      pending_[i].clear();
    }
  }
}

void HostSystemServices::EmitLine(ConsoleStream stream, std::string_view line) {
  if (stream == ConsoleStream::kStderr) {
    logger_->warn("{}", line);
  } else {
    logger_->info("{}", line);
  }
}

}  // namespace wapps::runtime
