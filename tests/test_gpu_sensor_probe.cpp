#include "minitest.hpp"
#include "sensor_fixture.hpp"
#include "collectors/SensorGpuProbe.hpp"
#include <cstdlib>
#include <vector>

using glance::collectors::SensorGpuProbe;
using glance::model::GpuSource;
using glance::model::SensorChannel;
using glance::model::SensorKind;

TEST(sensor_gpu_probe_from_channels) {
  std::vector<SensorChannel> ch{
    {"coretemp", "Core 0", SensorKind::Temperature, 50.0},
    {"amdgpu", "edge", SensorKind::Temperature, 63.0},
    {"amdgpu", "junction", SensorKind::Temperature, 70.0},
    {"amdgpu", "busy", SensorKind::Load, 12.0},
  };
  auto r = SensorGpuProbe::from_channels(ch);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->source == GpuSource::HardwareSensorService);
  ASSERT_EQ(*r->temperature_c, 63.0);
  ASSERT_EQ(*r->utilization_percent, 12.0);
}

TEST(sensor_gpu_probe_markers) {
  ASSERT_TRUE(SensorGpuProbe::is_gpu_channel({"nouveau", "temp1", SensorKind::Temperature, 1}));
  ASSERT_TRUE(SensorGpuProbe::is_gpu_channel({"radeon", "temp1", SensorKind::Temperature, 1}));
  ASSERT_TRUE(SensorGpuProbe::is_gpu_channel({"i915", "temp1", SensorKind::Temperature, 1}));
  ASSERT_TRUE(SensorGpuProbe::is_gpu_channel({"asus_ec", "GPU Hotspot", SensorKind::Temperature, 1}));
  ASSERT_TRUE(!SensorGpuProbe::is_gpu_channel({"coretemp", "Core 0", SensorKind::Temperature, 1}));
}

TEST(sensor_gpu_probe_temperature_only) {
  std::vector<SensorChannel> ch{{"nouveau", "temp1", SensorKind::Temperature, 48.0}};
  auto r = SensorGpuProbe::from_channels(ch);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(*r->temperature_c, 48.0);
  ASSERT_TRUE(!r->utilization_percent.has_value());
}

TEST(sensor_gpu_probe_no_gpu_channels) {
  std::vector<SensorChannel> ch{{"coretemp", "Core 0", SensorKind::Temperature, 50.0}};
  ASSERT_TRUE(!SensorGpuProbe::from_channels(ch).has_value());
}

TEST(sensor_gpu_probe_reads_hwmon) {
  auto root = glance_test::make_sys_root("gpuprobe");
  auto c0 = glance_test::add_chip(root, "hwmon0", "amdgpu");
  glance_test::put(c0 / "temp1_input", "58000");
  glance_test::put(c0 / "temp1_label", "edge");
  glance_test::put(c0 / "device/gpu_busy_percent", "23");
  setenv("GLANCE_SYS_ROOT", root.c_str(), 1);
  glance::collectors::HwmonSensorService svc;
  SensorGpuProbe p(svc);
  auto r = p.probe();
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(*r->temperature_c > 57.9 && *r->temperature_c < 58.1);
  ASSERT_EQ(*r->utilization_percent, 23.0);
}

TEST(sensor_gpu_probe_service_absent) {
  auto root = glance_test::make_sys_root("gpuprobe_absent");
  std::filesystem::remove_all(root / "sys/class/hwmon");
  setenv("GLANCE_SYS_ROOT", root.c_str(), 1);
  glance::collectors::HwmonSensorService svc;
  SensorGpuProbe p(svc);
  ASSERT_TRUE(!p.probe().has_value());
}

TEST(sensor_gpu_probe_ignores_out_of_range_load) {
  std::vector<SensorChannel> ch{
    {"amdgpu", "edge", SensorKind::Temperature, 61.0},
    {"amdgpu", "busy", SensorKind::Load, 4294967.0},
  };
  auto r = SensorGpuProbe::from_channels(ch);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(*r->temperature_c, 61.0);
  ASSERT_TRUE(!r->utilization_percent.has_value());
}
