#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <termios.h>

namespace glance::ui {

// Terminal state management
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;

void restore_terminal_minimal();
// SIGINT/SIGTERM: restore the terminal and request shutdown
void on_stop_signal(int);
void on_atexit_restore();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();
// `forced`: -1 detect from COLORTERM, 0 never, 1 always
[[nodiscard]] bool truecolor_capable(int forced = -1);
[[nodiscard]] bool use_unicode();
[[nodiscard]] int term_cols();

// SGR code generation (empty when stdout is not a TTY)
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_bold();
[[nodiscard]] std::string sgr_fg_grey();
[[nodiscard]] std::string sgr_palette_idx(int idx);
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b);
// "#RRGGBB" in truecolor, otherwise the basic palette entry `fallback_idx`
[[nodiscard]] std::string sgr_hex(const std::string& hex, int fallback_idx, bool truecolor);
[[nodiscard]] bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);
void best_effort_write(const std::string& s);

// RAII guards for terminal state
class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
  AltScreenGuard(const AltScreenGuard&) = delete;
  AltScreenGuard& operator=(const AltScreenGuard&) = delete;
};

} // namespace glance::ui
