#include "ui/TerminalOverlay.hpp"
#include "util/Log.hpp"
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>

namespace glance::ui {

TerminalOverlay::~TerminalOverlay() { hide(); }

void TerminalOverlay::show(const glance::model::Snapshot& initial) {
  current_ = initial;
  if (!shown_) {
    alt_ = std::make_unique<AltScreenGuard>(alt_screen_);
    cursor_ = std::make_unique<CursorGuard>();
    raw_ = std::make_unique<RawTermGuard>();
    shown_ = true;
  }
  draw();
}

void TerminalOverlay::update(const glance::model::Snapshot& s) {
  if (!shown_) return;
  current_ = s;
  draw();
}

void TerminalOverlay::hide() {
  if (!shown_) return;
  if (!alt_screen_) best_effort_write(std::string("\x1B[H\x1B[2J") + sgr_reset());
  raw_.reset();
  cursor_.reset();
  alt_.reset();
  shown_ = false;
}

void TerminalOverlay::draw() {
  last_cols_ = term_cols();
  best_effort_write(compose_frame(render_overlay(current_, style_), last_cols_));
}

bool TerminalOverlay::is_close_key(const unsigned char* buf, std::size_t n) {
  for (std::size_t k = 0; k < n; ++k) {
    unsigned char c = buf[k];
    if (c == 'q' || c == 'Q' || c == 'x' || c == 'X') return true;
    if (c == 0x1B) {
      // A lone ESC; "ESC [" starts an arrow or function key sequence
      if (k + 1 >= n) return true;
      if (buf[k + 1] != '[' && buf[k + 1] != 'O') return true;
      k += 2;
      while (k < n && (buf[k] < '@' || buf[k] > '~')) ++k;
    }
  }
  return false;
}

void TerminalOverlay::pump_input(std::chrono::milliseconds timeout) {
  if (!shown_ || stdin_eof_) {
    std::this_thread::sleep_for(timeout);
    return;
  }
  struct pollfd pfd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0};
  int rv = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (term_cols() != last_cols_) draw(); // resized
  if (rv <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) return;
  unsigned char buf[32];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n == 0) {
    GLANCE_LOG_DEBUG("stdin closed; overlay close key unavailable");
    stdin_eof_ = true;
    return;
  }
  if (n < 0) {
    if (errno != EAGAIN && errno != EINTR) {
      GLANCE_LOG_DEBUG("stdin read failed: %s", std::strerror(errno));
      stdin_eof_ = true;
    }
    return;
  }
  if (is_close_key(buf, static_cast<std::size_t>(n)) && close_cb_) close_cb_();
}

} // namespace glance::ui
