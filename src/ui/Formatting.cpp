#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>

namespace glance::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // final byte
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++;
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "…" : ".");
}

std::string format_usage(double pct) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", pct);
  return buf;
}

std::string format_gpu_usage(std::optional<double> pct) {
  if (!pct) return "N/A";
  char buf[32];
  double v = *pct;
  // Whole numbers as reported by the tools stay whole
  if (std::fabs(v - std::round(v)) < 1e-9) std::snprintf(buf, sizeof(buf), "%.0f%%", v);
  else std::snprintf(buf, sizeof(buf), "%.1f%%", v);
  return buf;
}

std::string format_temp(std::optional<double> celsius) {
  if (!celsius) return "N/A";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f°C", *celsius);
  return buf;
}

std::string format_clock(std::chrono::system_clock::time_point tp) {
  if (tp == std::chrono::system_clock::time_point{}) return "--:--:--";
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  if (!localtime_r(&t, &tm)) return "--:--:--";
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return buf;
}

} // namespace glance::ui
