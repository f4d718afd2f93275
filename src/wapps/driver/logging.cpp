#include "logging.hpp"

#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace wapps::driver {

void InitLogging(std::string_view level) {
  auto logger = spdlog::get("wapps");
  if (!logger) {
    logger = spdlog::stderr_color_mt("wapps");
  }
  logger->set_pattern("[wapps][%H:%M:%S][%l] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(std::string(level)));
}

}  // namespace wapps::driver
