#pragma once
#include <functional>
#include <memory>
#include <utility>
#include "model/Snapshot.hpp"
#include "ui/Renderer.hpp"
#include "ui/Surface.hpp"
#include "ui/Terminal.hpp"

namespace glance::ui {

// Boxed panel drawn at the top-right of the terminal. While shown the
// terminal is in the alternate screen with the cursor hidden and stdin in
// non-canonical mode; q, x or Esc requests a close.
class TerminalOverlay : public ITelemetrySurface {
public:
  TerminalOverlay(bool alt_screen, OverlayStyle style) : alt_screen_(alt_screen), style_(style) {}
  ~TerminalOverlay() override;

  void show(const glance::model::Snapshot& initial) override;
  void update(const glance::model::Snapshot& s) override;
  void hide() override;
  bool shown() const override { return shown_; }

  void on_close_requested(std::function<void()> cb) override { close_cb_ = std::move(cb); }
  void pump_input(std::chrono::milliseconds timeout) override;

  // True when `buf` contains a dismissal key (q, x, lone Esc)
  static bool is_close_key(const unsigned char* buf, std::size_t n);

private:
  void draw();

  bool alt_screen_;
  OverlayStyle style_;
  bool shown_{false};
  bool stdin_eof_{false};
  int last_cols_{0};
  glance::model::Snapshot current_{};
  std::function<void()> close_cb_;
  // Declaration order is restore order in reverse: raw mode first, then cursor, then screen
  std::unique_ptr<AltScreenGuard> alt_;
  std::unique_ptr<CursorGuard> cursor_;
  std::unique_ptr<RawTermGuard> raw_;
};

} // namespace glance::ui
