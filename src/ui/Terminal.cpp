#include "ui/Terminal.hpp"
#include "util/Strings.hpp"
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace glance::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, buf, len);
    if (n <= 0) return; // terminal gone; nothing useful to do
    buf += n; len -= static_cast<size_t>(n);
  }
}

void best_effort_write(const std::string& s) { best_effort_write(STDOUT_FILENO, s.data(), s.size()); }

void restore_terminal_minimal() {
  // Async-signal-safe restoration: exit alt screen first, then show cursor, reset SGR
  const char* alt_off = "\x1B[?1049l";
  const char* show_cur = "\x1B[?25h";
  const char* reset = "\x1B[0m";
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, alt_off, std::char_traits<char>::length(alt_off));
  best_effort_write(STDOUT_FILENO, show_cur, std::char_traits<char>::length(show_cur));
  best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
}

void on_stop_signal(int) { g_stop.store(true); }

void on_atexit_restore() {
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) tcdrain(STDOUT_FILENO);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

bool truecolor_capable(int forced) {
  if (forced >= 0) return forced > 0;
  const char* ct = std::getenv("COLORTERM");
  if (!ct) return false;
  auto s = glance::util::to_lower(ct);
  return s.find("truecolor") != std::string::npos || s.find("24bit") != std::string::npos;
}

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LC_CTYPE");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  auto s = glance::util::to_lower(lc);
  return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  const char* env = std::getenv("COLUMNS");
  if (env) { int c = std::atoi(env); if (c > 0) return c; }
  return 80;
}

std::string sgr(const char* code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() { return sgr("0"); }
std::string sgr_bold() { return sgr("1"); }
std::string sgr_fg_grey() { return sgr("90"); }

std::string sgr_palette_idx(int idx) {
  if (!tty_stdout()) return {};
  if (idx < 0) idx = 0;
  if (idx <= 7) return std::string("\x1B[") + std::to_string(30 + idx) + "m";
  if (idx <= 15) return std::string("\x1B[") + std::to_string(90 + (idx - 8)) + "m";
  // 256-color fallback
  return std::string("\x1B[38;5;") + std::to_string(idx) + "m";
}

std::string sgr_truecolor(int r, int g, int b) {
  if (!tty_stdout()) return {};
  r = std::clamp(r,0,255); g = std::clamp(g,0,255); b = std::clamp(b,0,255);
  return std::string("\x1B[38;2;") + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size() != 7 || hex[0] != '#') return false;
  auto hexv = [](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v[6];
  for (int i = 0; i < 6; ++i) { v[i] = hexv(hex[i + 1]); if (v[i] < 0) return false; }
  r = v[0]*16+v[1]; g = v[2]*16+v[3]; b = v[4]*16+v[5];
  return true;
}

std::string sgr_hex(const std::string& hex, int fallback_idx, bool truecolor) {
  int r = 0, g = 0, b = 0;
  if (truecolor && parse_hex_rgb(hex, r, g, b)) return sgr_truecolor(r, g, b);
  return sgr_palette_idx(fallback_idx);
}

// RAII guards for terminal state
RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~(ICANON | ECHO);
      neo.c_cc[VMIN] = 0;
      neo.c_cc[VTIME] = 0;
      if (tcsetattr(STDIN_FILENO, TCSANOW, &neo) == 0) {
        old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
        fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
        active_ = true;
      }
    }
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  }
}

CursorGuard::CursorGuard() {
  if (tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (enable && tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049h", 8);
    active_ = true;
    g_alt_in_use.store(true);
  }
}

AltScreenGuard::~AltScreenGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049l", 8);
    g_alt_in_use.store(false);
  }
}

} // namespace glance::ui
