#include "collectors/SensorGpuProbe.hpp"
#include "util/Strings.hpp"

namespace glance::collectors {

using glance::model::GpuReading;
using glance::model::GpuSource;
using glance::model::SensorChannel;
using glance::model::SensorKind;

bool SensorGpuProbe::is_gpu_channel(const SensorChannel& ch) {
  auto name = glance::util::to_lower(ch.name());
  for (const char* marker : {"gpu", "nouveau", "radeon", "i915"}) {
    if (name.find(marker) != std::string::npos) return true;
  }
  return false;
}

std::optional<GpuReading> SensorGpuProbe::from_channels(const std::vector<SensorChannel>& channels) {
  GpuReading r;
  for (const auto& ch : channels) {
    if (!is_gpu_channel(ch)) continue;
    if (ch.kind == SensorKind::Temperature && !r.temperature_c) r.temperature_c = ch.value;
    else if (ch.kind == SensorKind::Load && !r.utilization_percent) {
      // A busy counter outside 0..100 is a driver glitch, not a reading
      if (ch.value >= 0.0 && ch.value <= 100.0) r.utilization_percent = ch.value;
    }
  }
  if (!r.temperature_c && !r.utilization_percent) return std::nullopt;
  r.source = GpuSource::HardwareSensorService;
  return r;
}

std::optional<GpuReading> SensorGpuProbe::probe() {
  auto channels = sensors_.query();
  if (!channels) return std::nullopt;
  return from_channels(*channels);
}

} // namespace glance::collectors
