#include "collectors/SystemCollector.hpp"
#include "collectors/ThermalCollector.hpp"
#include "util/Log.hpp"

namespace glance::collectors {

glance::model::Snapshot SystemCollector::collect() {
  using glance::util::LogLevel;
  glance::model::Snapshot s{};

  if (auto cpu = cpu_.sample()) s.cpu_utilization_percent = *cpu;
  else GLANCE_LOG_ONCE(LogLevel::Warn, "cpu-stat", "cannot read /proc/stat; CPU usage reported as 0");

  if (const auto& channels = sensors_.refresh()) {
    s.cpu_temperature_c = ThermalCollector::cpu_temperature(*channels);
  } else {
    GLANCE_LOG_ONCE(LogLevel::Info, "hwmon-absent", "no hwmon class; temperatures unavailable");
  }

  glance::model::Memory mem{};
  if (mem_.sample(mem)) s.memory_utilization_percent = mem.used_pct;
  else GLANCE_LOG_ONCE(LogLevel::Warn, "meminfo", "cannot read /proc/meminfo; memory usage reported as 0");

  auto gpu = gpu_.resolve();
  s.gpu_utilization_percent = gpu.utilization_percent;
  s.gpu_temperature_c = gpu.temperature_c;
  s.gpu_source = gpu.source;

  s.captured_at = std::chrono::system_clock::now();
  return s;
}

} // namespace glance::collectors
