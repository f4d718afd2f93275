#pragma once

#include <string_view>

#include "wapps/runtime/frame_bridge.hpp"

namespace wapps::runtime {

// Window, canvas or texture that shows guest frames. Implemented by the
// embedding application.
class Presenter {
 public:
  virtual ~Presenter() = default;

  virtual void SetTitle(std::string_view title) = 0;

  // Show a frame. When a tick produces no image the presenter keeps showing
  // whatever it showed last.
  virtual void Present(const Image& image) = 0;

  // Block until the next display refresh. False once the host wants to
  // stop (window closed).
  virtual auto WaitForRefresh() -> bool = 0;
};

}  // namespace wapps::runtime
