#pragma once
#include <string>

namespace glance::model {

enum class SensorKind { Temperature, Load, Fan, Power };

// One named reading exposed by the hardware sensor service.
// Units: Temperature in °C, Load in percent, Fan in RPM, Power in Watts.
struct SensorChannel {
  std::string chip;   // hwmon "name" attribute, e.g. "coretemp", "amdgpu"
  std::string label;  // tempN_label or the attribute stem ("temp1")
  SensorKind  kind{SensorKind::Temperature};
  double      value{0.0};

  std::string name() const { return chip + " " + label; }
};

} // namespace glance::model
