#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include "collectors/GpuProbe.hpp"

namespace glance::collectors {

// System-wide GPU utilization from the kernel DRM per-client statistics in
// /proc/<pid>/fdinfo/<fd> (Documentation/gpu/drm-usage-stats.rst). Only
// descriptors whose /proc/<pid>/fd link points under /dev/dri are read.
// - drm-engine-<name>: busy time in ns; utilization = busy delta / wall delta.
// - drm-cycles-<name> with drm-total-cycles-<name>: utilization = cycles delta /
//   total-cycles delta (Intel xe).
// Busy deltas of all clients on one device are summed per engine; the busiest
// engine is the device utilization. Only the first device (by drm-pdev) is
// reported. The first call records a baseline and returns std::nullopt.
class FdinfoGpuProbe : public IGpuProbe {
public:
  using Clock = std::chrono::steady_clock;
  static constexpr std::chrono::milliseconds kScanBudget{5000};

  // Counters of one DRM client (one open file description of a GPU)
  struct ClientStats {
    std::string pdev;
    std::string client_id;
    std::map<std::string, uint64_t> engine_ns;
    std::map<std::string, uint64_t> cycles;
    std::map<std::string, uint64_t> total_cycles;
  };

  const char* name() const override { return "drm-fdinfo"; }
  std::optional<glance::model::GpuReading> probe() override { return probe_at(Clock::now()); }

  // Parse one fdinfo file; std::nullopt when it does not describe a DRM client.
  static std::optional<ClientStats> parse_fdinfo(std::string_view txt);

#ifdef GLANCE_TESTING
public:
#else
private:
#endif
  std::optional<glance::model::GpuReading> probe_at(Clock::time_point now);

private:
  // keyed by "<pdev>#<client-id>" (or "<pdev>#<pid>/<fd>" without client ids)
  using ClientMap = std::unordered_map<std::string, ClientStats>;
  bool scan(ClientMap& out) const;

  ClientMap last_;
  Clock::time_point last_tp_{};
  bool has_baseline_{false};
};

} // namespace glance::collectors
