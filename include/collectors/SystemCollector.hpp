#pragma once
#include <memory>
#include "collectors/CpuCollector.hpp"
#include "collectors/GpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/SensorService.hpp"
#include "model/Snapshot.hpp"

namespace glance::collectors {

// Produces one Snapshot per call. The sampler assigns seq.
class ISnapshotCollector {
public:
  virtual ~ISnapshotCollector() = default;
  virtual glance::model::Snapshot collect() = 0;
};

// CPU, then memory, then GPU, all on the calling thread. The sensor cache is
// refreshed once per collect(); GPU probes built on the same cache reuse it.
class SystemCollector : public ISnapshotCollector {
public:
  SystemCollector(CachedSensorService& sensors, GpuCollector gpu)
    : sensors_(sensors), gpu_(std::move(gpu)) {}

  glance::model::Snapshot collect() override;

private:
  CachedSensorService& sensors_;
  CpuCollector cpu_{};
  MemoryCollector mem_{};
  GpuCollector gpu_;
};

} // namespace glance::collectors
