#pragma once
#include <optional>
#include "app/EventQueue.hpp"
#include "model/Snapshot.hpp"
#include "ui/Surface.hpp"

namespace glance::app {

// Owns VisibilityState and the latest Snapshot; applies UI events to the
// surface. Single-threaded: lives on the UI-owning loop.
class OverlayController {
public:
  explicit OverlayController(glance::ui::ITelemetrySurface& surface) : surface_(surface) {}

  // False once a ShutdownRequested event has been handled.
  bool handle(const UiEvent& ev);

  void toggle();
  void close();
  void on_snapshot(const glance::model::Snapshot& s);
  // Hide if shown; used during shutdown.
  void hide();

  const glance::model::VisibilityState& visibility() const { return visibility_; }
  const std::optional<glance::model::Snapshot>& latest() const { return latest_; }

private:
  glance::ui::ITelemetrySurface& surface_;
  glance::model::VisibilityState visibility_{};
  std::optional<glance::model::Snapshot> latest_;
};

} // namespace glance::app
