#pragma once
#include <optional>
#include "model/Cpu.hpp"

namespace glance::collectors {

class CpuCollector {
public:
  CpuCollector() = default;
  // Aggregate utilization (0..100) since the previous call. The first call
  // establishes a short internal baseline so it already returns a real value.
  std::optional<double> sample();
private:
  std::optional<glance::model::CpuTimes> read_times() const;
  glance::model::CpuTimes last_{};
  bool has_last_{false};
};

} // namespace glance::collectors
