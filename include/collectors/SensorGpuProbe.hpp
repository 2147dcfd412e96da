#pragma once
#include <vector>
#include "collectors/GpuProbe.hpp"
#include "collectors/SensorService.hpp"

namespace glance::collectors {

// GPU temperature and load from the hardware sensor service. Only channels
// whose name mentions a GPU driver marker are considered.
class SensorGpuProbe : public IGpuProbe {
public:
  explicit SensorGpuProbe(ISensorService& sensors) : sensors_(sensors) {}

  const char* name() const override { return "hwmon"; }
  std::optional<glance::model::GpuReading> probe() override;

  static bool is_gpu_channel(const glance::model::SensorChannel& ch);
  static std::optional<glance::model::GpuReading> from_channels(const std::vector<glance::model::SensorChannel>& channels);

private:
  ISensorService& sensors_;
};

} // namespace glance::collectors
