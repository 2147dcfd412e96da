#include "app/OverlayController.hpp"
#include "util/Log.hpp"

namespace glance::app {

namespace {
template <class... Fs> struct Overloaded : Fs... { using Fs::operator()...; };
template <class... Fs> Overloaded(Fs...) -> Overloaded<Fs...>;
} // namespace

bool OverlayController::handle(const UiEvent& ev) {
  return std::visit(Overloaded{
    [this](const ToggleRequested&)   { toggle(); return true; },
    [this](const CloseRequested&)    { close(); return true; },
    [this](const SnapshotReady& r)   { on_snapshot(r.snapshot); return true; },
    [](const ShutdownRequested&)     { return false; },
  }, ev);
}

void OverlayController::toggle() {
  if (visibility_.shown) {
    hide();
    return;
  }
  surface_.show(latest_.value_or(glance::model::Snapshot{}));
  visibility_.shown = true;
  GLANCE_LOG_DEBUG("overlay shown");
}

void OverlayController::close() {
  // Dismissal from the surface behaves like a toggle-off
  if (visibility_.shown) hide();
}

void OverlayController::on_snapshot(const glance::model::Snapshot& s) {
  latest_ = s;
  if (visibility_.shown) surface_.update(s);
}

void OverlayController::hide() {
  if (!visibility_.shown) return;
  surface_.hide();
  visibility_.shown = false;
  GLANCE_LOG_DEBUG("overlay hidden");
}

} // namespace glance::app
