#pragma once
#include <chrono>
#include <functional>
#include "model/Snapshot.hpp"

namespace glance::ui {

// Presentation surface for telemetry. Called only from the UI-owning loop.
class ITelemetrySurface {
public:
  virtual ~ITelemetrySurface() = default;

  virtual void show(const glance::model::Snapshot& initial) = 0;
  // No-op while hidden
  virtual void update(const glance::model::Snapshot& s) = 0;
  virtual void hide() = 0;
  virtual bool shown() const = 0;

  // Invoked from pump_input() when the user dismisses the surface itself.
  virtual void on_close_requested(std::function<void()> cb) = 0;
  // Read and dispatch the surface's own input for up to `timeout`.
  virtual void pump_input(std::chrono::milliseconds timeout) = 0;
};

} // namespace glance::ui
