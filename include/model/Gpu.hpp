#pragma once
#include <optional>

namespace glance::model {

// Which acquisition strategy produced the GPU fields of a Snapshot
enum class GpuSource { PrimaryTool, HardwareSensorService, OsPerformanceCounter, None };

inline const char* to_string(GpuSource s) {
  switch (s) {
    case GpuSource::PrimaryTool:           return "nvidia-smi";
    case GpuSource::HardwareSensorService: return "hwmon";
    case GpuSource::OsPerformanceCounter:  return "drm-fdinfo";
    case GpuSource::None:                  return "none";
  }
  return "none";
}

struct GpuReading {
  std::optional<double> temperature_c;
  std::optional<double> utilization_percent; // 0..100
  GpuSource source{GpuSource::None};
};

} // namespace glance::model
