#pragma once
#include <atomic>
#include <chrono>
#include "app/EventQueue.hpp"
#include "app/OverlayController.hpp"
#include "ui/Surface.hpp"

namespace glance::app {

// The UI-owning loop: drains the EventQueue into the OverlayController and
// lets the surface read its own input while shown. Returns from run() on
// ShutdownRequested; `stop` becoming true posts one.
class UiLoop {
public:
  static constexpr std::chrono::milliseconds kSlice{100};

  UiLoop(EventQueue& queue, glance::ui::ITelemetrySurface& surface,
         OverlayController& controller, const std::atomic<bool>& stop);

  void run();

private:
  // False on ShutdownRequested
  bool drain();

  EventQueue& queue_;
  glance::ui::ITelemetrySurface& surface_;
  OverlayController& controller_;
  const std::atomic<bool>& stop_;
};

} // namespace glance::app
