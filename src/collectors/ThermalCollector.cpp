#include "collectors/ThermalCollector.hpp"
#include "util/Strings.hpp"

namespace glance::collectors {

std::optional<double> ThermalCollector::cpu_temperature(const std::vector<glance::model::SensorChannel>& channels) {
  for (const auto& ch : channels) {
    if (ch.kind != glance::model::SensorKind::Temperature) continue;
    auto name = glance::util::to_lower(ch.name());
    if (name.find("cpu") != std::string::npos || name.find("core") != std::string::npos)
      return ch.value;
  }
  return std::nullopt;
}

} // namespace glance::collectors
