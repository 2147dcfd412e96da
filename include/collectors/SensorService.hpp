#pragma once
#include <optional>
#include <string>
#include <vector>
#include "model/Sensor.hpp"

namespace glance::collectors {

// Local hardware-sensor service: a flat list of named channels.
class ISensorService {
public:
  virtual ~ISensorService() = default;
  // std::nullopt when the service itself is unavailable; an empty vector when
  // it is present but exposes no channels.
  virtual std::optional<std::vector<glance::model::SensorChannel>> query() = 0;
};

// Kernel hwmon class (/sys/class/hwmon/hwmon*). Reads tempN_input (m°C),
// fanN_input (RPM), powerN_average/powerN_input (µW) with their labels, and
// the DRM busy counter of the parent device (device/gpu_busy_percent) as a
// load channel.
class HwmonSensorService : public ISensorService {
public:
  std::optional<std::vector<glance::model::SensorChannel>> query() override;
};

// Remembers one query of the wrapped service. refresh() runs once per
// sampling tick; every query() in between returns that result, so the CPU
// temperature and the GPU sensor probe read the same channels from a single
// walk.
class CachedSensorService : public ISensorService {
public:
  explicit CachedSensorService(ISensorService& inner) : inner_(inner) {}

  const std::optional<std::vector<glance::model::SensorChannel>>& refresh();
  // Refreshes on first use.
  std::optional<std::vector<glance::model::SensorChannel>> query() override;

private:
  ISensorService& inner_;
  std::optional<std::vector<glance::model::SensorChannel>> last_;
  bool fresh_{false};
};

} // namespace glance::collectors
