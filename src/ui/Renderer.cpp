#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>

namespace glance::ui {

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0,n* (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width, int min_height) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  auto top = [&]{
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - display_cols(t));
    int left = fill / 2; int right = fill - left;
    return TL + repeat_str(H, left) + t + repeat_str(H, right) + TR;
  }();
  out.push_back(top);
  int content_lines = std::max((int)lines.size(), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < (int)lines.size()) ? lines[i] : std::string();
    out.push_back(V + trunc_pad(ln, iw) + V);
  }
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

static std::string centered(const std::string& s, int iw) {
  int pad = std::max(0, (iw - display_cols(s)) / 2);
  return std::string(pad, ' ') + s;
}

std::vector<std::string> render_overlay(const glance::model::Snapshot& s, const OverlayStyle& style) {
  const int iw = kOverlayWidth - 2;
  const auto reset = sgr_reset();
  const auto cpu_c = sgr_hex("#4CAF50", 2, style.truecolor);
  const auto mem_c = sgr_hex("#2196F3", 4, style.truecolor);
  const auto gpu_c = sgr_hex("#FF9800", 3, style.truecolor);
  const auto grey  = sgr_fg_grey();

  std::vector<std::string> lines;
  lines.push_back(sgr_bold() + cpu_c + " CPU:" + reset);
  lines.push_back("   Usage: " + format_usage(s.cpu_utilization_percent));
  lines.push_back("   Temp: " + format_temp(s.cpu_temperature_c));
  lines.push_back(sgr_bold() + mem_c + " Memory:" + reset);
  lines.push_back("   Usage: " + format_usage(s.memory_utilization_percent));
  lines.push_back(sgr_bold() + gpu_c + " GPU:" + reset);
  lines.push_back("   Usage: " + format_gpu_usage(s.gpu_utilization_percent));
  lines.push_back("   Temp: " + format_temp(s.gpu_temperature_c));
  lines.push_back(grey + "   Source: " + glance::model::to_string(s.gpu_source) + reset);
  lines.push_back(std::string());
  lines.push_back(grey + centered("Updated: " + format_clock(s.captured_at), iw) + reset);
  lines.push_back(centered("[ Close (Ctrl+Shift+M) ]", iw));

  auto box = make_box("System Monitor", lines, kOverlayWidth);
  // Borders in grey; content rows keep their own colors
  box.front() = grey + box.front() + reset;
  box.back() = grey + box.back() + reset;
  return box;
}

std::string compose_frame(const std::vector<std::string>& box, int cols) {
  int col = std::max(1, cols - kOverlayWidth - kOverlayRightMargin + 1);
  std::string out = "\x1B[H\x1B[2J";
  int row = 1 + kOverlayTopMargin;
  for (const auto& ln : box) {
    out += "\x1B[" + std::to_string(row++) + ";" + std::to_string(col) + "H";
    out += ln;
  }
  return out;
}

} // namespace glance::ui
