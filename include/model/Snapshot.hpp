#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include "model/Gpu.hpp"

namespace glance::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
  double   used_pct{}; // 0..100
};

// One sampling tick. Always fully formed; unavailable sources are empty
// optionals rather than errors.
struct Snapshot {
  uint64_t seq{};
  double cpu_utilization_percent{};              // 0..100
  std::optional<double> cpu_temperature_c;
  double memory_utilization_percent{};           // 0..100
  std::optional<double> gpu_utilization_percent; // 0..100
  std::optional<double> gpu_temperature_c;
  GpuSource gpu_source{GpuSource::None};
  std::chrono::system_clock::time_point captured_at{};
};

// Whether the overlay is rendered. Written only by the OverlayController.
struct VisibilityState {
  bool shown{false};
};

} // namespace glance::model
