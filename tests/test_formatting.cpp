#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include <chrono>
#include <string>

using namespace glance::ui;

static bool contains(const std::vector<std::string>& rows, const std::string& needle) {
  for (const auto& r : rows) if (r.find(needle) != std::string::npos) return true;
  return false;
}

TEST(format_usage_one_decimal) {
  ASSERT_EQ(format_usage(12.345), std::string("12.3%"));
  ASSERT_EQ(format_usage(0.0), std::string("0.0%"));
  ASSERT_EQ(format_usage(100.0), std::string("100.0%"));
}

TEST(format_gpu_usage_keeps_integers) {
  ASSERT_EQ(format_gpu_usage(45.0), std::string("45%"));
  ASSERT_EQ(format_gpu_usage(37.5), std::string("37.5%"));
  ASSERT_EQ(format_gpu_usage(0.0), std::string("0%"));
  ASSERT_EQ(format_gpu_usage(std::nullopt), std::string("N/A"));
}

TEST(format_temp_celsius) {
  ASSERT_EQ(format_temp(62.0), std::string("62.0°C"));
  ASSERT_EQ(format_temp(51.26), std::string("51.3°C"));
  ASSERT_EQ(format_temp(std::nullopt), std::string("N/A"));
}

TEST(format_clock_default_time_point) {
  ASSERT_EQ(format_clock({}), std::string("--:--:--"));
  auto s = format_clock(std::chrono::system_clock::now());
  ASSERT_EQ(s.size(), 8u);
  ASSERT_EQ(s[2], ':');
  ASSERT_EQ(s[5], ':');
}

TEST(display_cols_ignores_sgr) {
  ASSERT_EQ(display_cols("\x1B[38;2;76;175;80mCPU\x1B[0m"), 3);
  ASSERT_EQ(display_cols("62.0°C"), 6);
  ASSERT_EQ(display_cols(trunc_pad("abc", 6)), 6);
  ASSERT_EQ(display_cols(trunc_pad("abcdefgh", 4)), 4);
}

TEST(make_box_fixed_width) {
  auto box = make_box("System Monitor", {"one", "two"}, kOverlayWidth, 4);
  ASSERT_EQ(box.size(), 6u);
  for (const auto& row : box) ASSERT_EQ(display_cols(row), kOverlayWidth);
  ASSERT_TRUE(box.front().find("[ System Monitor ]") != std::string::npos);
}

TEST(render_overlay_full_snapshot) {
  glance::model::Snapshot s;
  s.cpu_utilization_percent = 23.4;
  s.cpu_temperature_c = 48.0;
  s.memory_utilization_percent = 61.0;
  s.gpu_utilization_percent = 45.0;
  s.gpu_temperature_c = 62.0;
  s.gpu_source = glance::model::GpuSource::PrimaryTool;
  auto rows = render_overlay(s, OverlayStyle{});
  for (const auto& row : rows) ASSERT_EQ(display_cols(row), kOverlayWidth);
  ASSERT_TRUE(contains(rows, " CPU:"));
  ASSERT_TRUE(contains(rows, "Usage: 23.4%"));
  ASSERT_TRUE(contains(rows, "Temp: 48.0°C"));
  ASSERT_TRUE(contains(rows, " Memory:"));
  ASSERT_TRUE(contains(rows, "Usage: 61.0%"));
  ASSERT_TRUE(contains(rows, " GPU:"));
  ASSERT_TRUE(contains(rows, "Usage: 45%"));
  ASSERT_TRUE(contains(rows, "Temp: 62.0°C"));
  ASSERT_TRUE(contains(rows, "Source: nvidia-smi"));
  ASSERT_TRUE(contains(rows, "Updated: --:--:--"));
  ASSERT_TRUE(contains(rows, "[ Close (Ctrl+Shift+M) ]"));
}

TEST(render_overlay_missing_values) {
  glance::model::Snapshot s;
  s.gpu_utilization_percent = 37.5;
  s.gpu_source = glance::model::GpuSource::OsPerformanceCounter;
  auto rows = render_overlay(s, OverlayStyle{true});
  ASSERT_TRUE(contains(rows, "Temp: N/A"));
  ASSERT_TRUE(contains(rows, "Usage: 37.5%"));
  ASSERT_TRUE(contains(rows, "Source: drm-fdinfo"));
}

TEST(compose_frame_top_right) {
  std::vector<std::string> box{"a", "b"};
  auto f = compose_frame(box, 100);
  // 100 - 34 - 2 + 1
  ASSERT_TRUE(f.find("\x1B[2;65Ha") != std::string::npos);
  ASSERT_TRUE(f.find("\x1B[3;65Hb") != std::string::npos);
  // Narrow terminals clamp to column 1
  f = compose_frame(box, 20);
  ASSERT_TRUE(f.find("\x1B[2;1Ha") != std::string::npos);
}
