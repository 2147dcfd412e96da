#include "collectors/GpuCollector.hpp"
#include "collectors/FdinfoGpuProbe.hpp"
#include "collectors/NvidiaSmiProbe.hpp"
#include "collectors/SensorGpuProbe.hpp"
#include "util/Log.hpp"

#include <exception>

namespace glance::collectors {

using glance::model::GpuReading;
using glance::model::GpuSource;

GpuReading GpuCollector::resolve() {
  GpuReading out{};
  for (auto& p : probes_) {
    std::optional<GpuReading> r;
    try {
      r = p->probe();
    } catch (const std::exception& e) {
      GLANCE_LOG_DEBUG("gpu probe %s failed: %s", p->name(), e.what());
      continue;
    } catch (...) {
      GLANCE_LOG_DEBUG("gpu probe %s failed: unknown exception", p->name());
      continue;
    }
    if (!r || (!r->utilization_percent && !r->temperature_c)) continue;
    out = *r;
    break;
  }
  if (!has_last_ || out.source != last_source_) {
    GLANCE_LOG_DEBUG("gpu source: %s", glance::model::to_string(out.source));
    last_source_ = out.source; has_last_ = true;
  }
  return out;
}

std::vector<std::unique_ptr<IGpuProbe>> make_default_gpu_probes(const std::string& smi_path,
                                                                ISensorService& sensors) {
  std::vector<std::unique_ptr<IGpuProbe>> v;
  v.push_back(std::make_unique<NvidiaSmiProbe>(smi_path));
  v.push_back(std::make_unique<SensorGpuProbe>(sensors));
  v.push_back(std::make_unique<FdinfoGpuProbe>());
  return v;
}

} // namespace glance::collectors
