#pragma once

#include <string>

#include "wapps/common/diagnostic.hpp"

namespace wapps::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace wapps::driver
