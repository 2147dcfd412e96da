#pragma once
#include <memory>
#include <string>
#include <vector>
#include "collectors/GpuProbe.hpp"
#include "collectors/SensorService.hpp"

namespace glance::collectors {

// GPU metric resolver: walks the probes in order and returns the first usable
// reading. Probe failures (including exceptions) fall through to the next
// probe; when every probe is exhausted the reading is empty with source None.
class GpuCollector {
public:
  explicit GpuCollector(std::vector<std::unique_ptr<IGpuProbe>> probes)
    : probes_(std::move(probes)) {}

  glance::model::GpuReading resolve();

  std::size_t probe_count() const { return probes_.size(); }

private:
  std::vector<std::unique_ptr<IGpuProbe>> probes_;
  glance::model::GpuSource last_source_{glance::model::GpuSource::None};
  bool has_last_{false};
};

// nvidia-smi, then the sensor service, then DRM fdinfo counters.
std::vector<std::unique_ptr<IGpuProbe>> make_default_gpu_probes(const std::string& smi_path,
                                                                ISensorService& sensors);

} // namespace glance::collectors
