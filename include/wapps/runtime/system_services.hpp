#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <span>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace wapps::runtime {

// Clock identifiers as numbered by the guest system-call ABI.
enum class ClockId : uint32_t {
  kRealtime = 0,
  kMonotonic = 1,
  kProcessCpuTime = 2,
  kThreadCpuTime = 3,
};

// Longest partial console line held back waiting for a newline.
inline constexpr size_t kMaxPendingConsoleBytes = 4096;

enum class ConsoleStream : uint8_t { kStdout, kStderr };

// Everything the minimal system-call surface can reach: clocks, randomness
// and diagnostic console output. Nothing here touches files, sockets or
// processes.
class SystemServices {
 public:
  virtual ~SystemServices() = default;

  virtual auto NowNanoseconds(ClockId clock) -> uint64_t = 0;
  virtual auto ResolutionNanoseconds(ClockId clock) -> uint64_t = 0;
  virtual void FillRandom(std::span<uint8_t> out) = 0;
  virtual void WriteConsole(ConsoleStream stream, std::string_view text) = 0;
};

// Production services: std::chrono clocks, the OS entropy source, and
// console text routed line by line to the "guest" logger.
class HostSystemServices final : public SystemServices {
 public:
  explicit HostSystemServices(bool forward_console = true);
  ~HostSystemServices() override;

  HostSystemServices(const HostSystemServices&) = delete;
  auto operator=(const HostSystemServices&) -> HostSystemServices& = delete;
  HostSystemServices(HostSystemServices&&) = delete;
  auto operator=(HostSystemServices&&) -> HostSystemServices& = delete;

  auto NowNanoseconds(ClockId clock) -> uint64_t override;
  auto ResolutionNanoseconds(ClockId clock) -> uint64_t override;
  void FillRandom(std::span<uint8_t> out) override;
  void WriteConsole(ConsoleStream stream, std::string_view text) override;

  // Emit any partial lines still buffered.
  void FlushConsole();

 private:
  void EmitLine(ConsoleStream stream, std::string_view line);

  bool forward_console_;
  std::shared_ptr<spdlog::logger> logger_;
  std::random_device entropy_;
  std::array<std::string, 2> pending_;
};

}  // namespace wapps::runtime
