#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace glance::ui {

// UTF-8 text width utilities (SGR sequences count as zero columns)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);

// Metric values as shown on the overlay
std::string format_usage(double pct);                     // "12.3%"
std::string format_gpu_usage(std::optional<double> pct);  // "45%", "37.5%" or "N/A"
std::string format_temp(std::optional<double> celsius);   // "45.0°C" or "N/A"

// Local wall-clock "HH:MM:SS"; "--:--:--" for a default time_point
std::string format_clock(std::chrono::system_clock::time_point tp);

} // namespace glance::ui
