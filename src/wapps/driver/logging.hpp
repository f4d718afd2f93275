#pragma once

#include <string_view>

namespace wapps::driver {

// Install the "wapps" stderr logger as the spdlog default and apply the
// level ("trace" ... "off"). Guest console output keeps its own logger.
void InitLogging(std::string_view level);

}  // namespace wapps::driver
