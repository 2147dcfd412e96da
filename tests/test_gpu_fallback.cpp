#include "minitest.hpp"
#include "collectors/GpuCollector.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

using glance::collectors::GpuCollector;
using glance::collectors::IGpuProbe;
using glance::model::GpuReading;
using glance::model::GpuSource;

namespace {

// Scripted probe; counts how often it was asked
struct FakeProbe : IGpuProbe {
  std::optional<GpuReading> result;
  bool throws{false};
  int* calls{nullptr};

  const char* name() const override { return "fake"; }
  std::optional<GpuReading> probe() override {
    if (calls) ++*calls;
    if (throws) throw std::runtime_error("probe exploded");
    return result;
  }
};

std::unique_ptr<IGpuProbe> make_probe(std::optional<GpuReading> r, int* calls, bool throws = false) {
  auto p = std::make_unique<FakeProbe>();
  p->result = r;
  p->calls = calls;
  p->throws = throws;
  return p;
}

GpuReading reading(std::optional<double> temp, std::optional<double> util, GpuSource src) {
  GpuReading r;
  r.temperature_c = temp;
  r.utilization_percent = util;
  r.source = src;
  return r;
}

} // namespace

TEST(gpu_primary_wins_and_short_circuits) {
  int primary = 0, sensor = 0, counter = 0;
  std::vector<std::unique_ptr<IGpuProbe>> probes;
  probes.push_back(make_probe(reading(62.0, 45.0, GpuSource::PrimaryTool), &primary));
  probes.push_back(make_probe(reading(70.0, 10.0, GpuSource::HardwareSensorService), &sensor));
  probes.push_back(make_probe(reading(std::nullopt, 99.0, GpuSource::OsPerformanceCounter), &counter));
  GpuCollector gpu(std::move(probes));
  auto r = gpu.resolve();
  ASSERT_TRUE(r.source == GpuSource::PrimaryTool);
  ASSERT_EQ(*r.utilization_percent, 45.0);
  ASSERT_EQ(*r.temperature_c, 62.0);
  ASSERT_EQ(primary, 1);
  ASSERT_EQ(sensor, 0);
  ASSERT_EQ(counter, 0);
}

TEST(gpu_falls_through_to_counters) {
  int primary = 0, sensor = 0, counter = 0;
  std::vector<std::unique_ptr<IGpuProbe>> probes;
  probes.push_back(make_probe(std::nullopt, &primary));
  probes.push_back(make_probe(std::nullopt, &sensor));
  probes.push_back(make_probe(reading(std::nullopt, 37.5, GpuSource::OsPerformanceCounter), &counter));
  GpuCollector gpu(std::move(probes));
  auto r = gpu.resolve();
  ASSERT_TRUE(r.source == GpuSource::OsPerformanceCounter);
  ASSERT_EQ(*r.utilization_percent, 37.5);
  ASSERT_TRUE(!r.temperature_c.has_value());
  ASSERT_EQ(primary + sensor + counter, 3);
}

TEST(gpu_empty_reading_falls_through) {
  int sensor = 0;
  std::vector<std::unique_ptr<IGpuProbe>> probes;
  // A reading with neither field is as good as none
  probes.push_back(make_probe(reading(std::nullopt, std::nullopt, GpuSource::PrimaryTool), nullptr));
  probes.push_back(make_probe(reading(55.0, std::nullopt, GpuSource::HardwareSensorService), &sensor));
  GpuCollector gpu(std::move(probes));
  auto r = gpu.resolve();
  ASSERT_TRUE(r.source == GpuSource::HardwareSensorService);
  ASSERT_EQ(*r.temperature_c, 55.0);
  ASSERT_TRUE(!r.utilization_percent.has_value());
  ASSERT_EQ(sensor, 1);
}

TEST(gpu_all_probes_fail) {
  int calls = 0;
  std::vector<std::unique_ptr<IGpuProbe>> probes;
  probes.push_back(make_probe(std::nullopt, &calls, true));
  probes.push_back(make_probe(std::nullopt, &calls, true));
  probes.push_back(make_probe(std::nullopt, &calls));
  GpuCollector gpu(std::move(probes));
  auto r = gpu.resolve();
  ASSERT_TRUE(r.source == GpuSource::None);
  ASSERT_TRUE(!r.utilization_percent.has_value());
  ASSERT_TRUE(!r.temperature_c.has_value());
  ASSERT_EQ(calls, 3);
  // Resolving again is just as quiet
  r = gpu.resolve();
  ASSERT_TRUE(r.source == GpuSource::None);
}

TEST(gpu_no_probes) {
  GpuCollector gpu({});
  ASSERT_EQ(gpu.probe_count(), 0u);
  ASSERT_TRUE(gpu.resolve().source == GpuSource::None);
}

namespace {
struct IntThrowingProbe : IGpuProbe {
  const char* name() const override { return "int-thrower"; }
  std::optional<GpuReading> probe() override { throw 42; }
};
} // namespace

TEST(gpu_non_standard_exception_falls_through) {
  int counter = 0;
  std::vector<std::unique_ptr<IGpuProbe>> probes;
  probes.push_back(std::make_unique<IntThrowingProbe>());
  probes.push_back(make_probe(reading(std::nullopt, 37.5, GpuSource::OsPerformanceCounter), &counter));
  GpuCollector gpu(std::move(probes));
  bool escaped = false;
  GpuReading r;
  try { r = gpu.resolve(); } catch (int) { escaped = true; }
  ASSERT_TRUE(!escaped);
  ASSERT_TRUE(r.source == GpuSource::OsPerformanceCounter);
  ASSERT_EQ(counter, 1);
}
