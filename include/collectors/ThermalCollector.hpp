#pragma once
#include <optional>
#include <vector>
#include "model/Sensor.hpp"

namespace glance::collectors {

class ThermalCollector {
public:
  // First temperature channel whose name mentions "cpu" or "core"
  // (case-insensitive), in service order.
  static std::optional<double> cpu_temperature(const std::vector<glance::model::SensorChannel>& channels);
};

} // namespace glance::collectors
