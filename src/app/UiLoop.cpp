#include "app/UiLoop.hpp"

namespace glance::app {

UiLoop::UiLoop(EventQueue& queue, glance::ui::ITelemetrySurface& surface,
               OverlayController& controller, const std::atomic<bool>& stop)
  : queue_(queue), surface_(surface), controller_(controller), stop_(stop) {
  surface_.on_close_requested([this]{ queue_.post(CloseRequested{}); });
}

bool UiLoop::drain() {
  while (auto ev = queue_.try_pop()) {
    if (!controller_.handle(*ev)) return false;
  }
  return true;
}

void UiLoop::run() {
  bool shutdown_posted = false;
  for (;;) {
    if (!shutdown_posted && stop_.load()) {
      // The signal handler only sets the flag; events already queued are
      // applied before the shutdown.
      shutdown_posted = true;
      if (!queue_.post(ShutdownRequested{})) return; // full queue: stop now
    }
    if (controller_.visibility().shown) {
      surface_.pump_input(kSlice);
    } else if (auto ev = queue_.wait_pop(kSlice)) {
      if (!controller_.handle(*ev)) return;
    }
    if (!drain()) return;
  }
}

} // namespace glance::app
