#pragma once
#include <optional>
#include "model/Gpu.hpp"

namespace glance::collectors {

// One self-contained way of obtaining GPU metrics. A probe returns
// std::nullopt when it has nothing usable; the resolver then moves on.
class IGpuProbe {
public:
  virtual ~IGpuProbe() = default;
  virtual const char* name() const = 0;
  virtual std::optional<glance::model::GpuReading> probe() = 0;
};

} // namespace glance::collectors
