#include "minitest.hpp"
#include "collectors/FdinfoGpuProbe.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace std::chrono_literals;
namespace fs = std::filesystem;
using glance::collectors::FdinfoGpuProbe;
using glance::model::GpuSource;

static fs::path make_proc_root(const std::string& tag) {
  auto root = fs::temp_directory_path() / fs::path("glance_test_fdinfo_" + tag) / fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc");
  return root;
}

// Writes /proc/<pid>/fdinfo/<fd> and points /proc/<pid>/fd/<fd> at link_target.
// The link may dangle; only its text is read.
static void write_fdinfo(const fs::path& root, int pid, int fd, const std::string& body,
                         const std::string& link_target = "/dev/dri/renderD128") {
  auto pid_dir = root / "proc" / std::to_string(pid);
  fs::create_directories(pid_dir / "fdinfo");
  fs::create_directories(pid_dir / "fd");
  std::ofstream(pid_dir / "fdinfo" / std::to_string(fd)) << body;
  auto link = pid_dir / "fd" / std::to_string(fd);
  std::error_code ec;
  fs::remove(link, ec);
  fs::create_symlink(link_target, link);
}

static std::string amd_client(const char* pdev, int client, unsigned long long gfx_ns) {
  return std::string("pos:\t0\nflags:\t02100002\n"
                     "drm-driver:\tamdgpu\n"
                     "drm-pdev:\t") + pdev + "\n"
         "drm-client-id:\t" + std::to_string(client) + "\n"
         "drm-engine-gfx:\t" + std::to_string(gfx_ns) + " ns\n"
         "drm-engine-compute:\t0 ns\n"
         "drm-engine-capacity-gfx:\t1\n";
}

TEST(fdinfo_probe_engine_ns_utilization) {
  auto root = make_proc_root("ns");
  write_fdinfo(root, 4242, 7, amd_client("0000:03:00.0", 11, 1000000000ull));
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  FdinfoGpuProbe p;
  auto t0 = FdinfoGpuProbe::Clock::now();
  // First call is the baseline
  ASSERT_TRUE(!p.probe_at(t0).has_value());
  // 0.75 s busy over 2 s wall
  write_fdinfo(root, 4242, 7, amd_client("0000:03:00.0", 11, 1750000000ull));
  auto r = p.probe_at(t0 + 2s);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->source == GpuSource::OsPerformanceCounter);
  ASSERT_TRUE(!r->temperature_c.has_value());
  ASSERT_TRUE(*r->utilization_percent > 37.49 && *r->utilization_percent < 37.51);
}

TEST(fdinfo_probe_sums_clients_and_dedups_shared_fds) {
  auto root = make_proc_root("sum");
  write_fdinfo(root, 100, 5, amd_client("0000:03:00.0", 1, 0));
  // Same client reached through a dup()ed descriptor
  write_fdinfo(root, 100, 6, amd_client("0000:03:00.0", 1, 0));
  write_fdinfo(root, 200, 9, amd_client("0000:03:00.0", 2, 0));
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  FdinfoGpuProbe p;
  auto t0 = FdinfoGpuProbe::Clock::now();
  ASSERT_TRUE(!p.probe_at(t0).has_value());
  write_fdinfo(root, 100, 5, amd_client("0000:03:00.0", 1, 200000000ull));
  write_fdinfo(root, 100, 6, amd_client("0000:03:00.0", 1, 200000000ull));
  write_fdinfo(root, 200, 9, amd_client("0000:03:00.0", 2, 300000000ull));
  auto r = p.probe_at(t0 + 1s);
  ASSERT_TRUE(r.has_value());
  // 0.2 s + 0.3 s of gfx over 1 s
  ASSERT_TRUE(*r->utilization_percent > 49.9 && *r->utilization_percent < 50.1);
}

TEST(fdinfo_probe_cycles_counters) {
  auto root = make_proc_root("cycles");
  auto body = [](unsigned long long cyc, unsigned long long total) {
    return std::string("drm-driver:\txe\n"
                       "drm-pdev:\t0000:00:02.0\n"
                       "drm-client-id:\t3\n"
                       "drm-cycles-rcs:\t") + std::to_string(cyc) + "\n"
           "drm-total-cycles-rcs:\t" + std::to_string(total) + "\n";
  };
  write_fdinfo(root, 4242, 3, body(1000, 10000));
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  FdinfoGpuProbe p;
  auto t0 = FdinfoGpuProbe::Clock::now();
  ASSERT_TRUE(!p.probe_at(t0).has_value());
  write_fdinfo(root, 4242, 3, body(2000, 20000));
  auto r = p.probe_at(t0 + 2s);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(*r->utilization_percent > 9.99 && *r->utilization_percent < 10.01);
}

TEST(fdinfo_probe_reports_first_device_only) {
  auto root = make_proc_root("multi");
  write_fdinfo(root, 300, 4, amd_client("0000:0b:00.0", 1, 0));
  write_fdinfo(root, 301, 4, amd_client("0000:03:00.0", 2, 0));
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  FdinfoGpuProbe p;
  auto t0 = FdinfoGpuProbe::Clock::now();
  ASSERT_TRUE(!p.probe_at(t0).has_value());
  write_fdinfo(root, 300, 4, amd_client("0000:0b:00.0", 1, 900000000ull));
  write_fdinfo(root, 301, 4, amd_client("0000:03:00.0", 2, 100000000ull));
  auto r = p.probe_at(t0 + 1s);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(*r->utilization_percent > 9.9 && *r->utilization_percent < 10.1);
}

TEST(fdinfo_probe_no_drm_clients) {
  auto root = make_proc_root("none");
  write_fdinfo(root, 55, 0, "pos:\t0\nflags:\t0100002\nmnt_id:\t25\n");
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  FdinfoGpuProbe p;
  auto t0 = FdinfoGpuProbe::Clock::now();
  ASSERT_TRUE(!p.probe_at(t0).has_value());
  ASSERT_TRUE(!p.probe_at(t0 + 2s).has_value());
}

TEST(fdinfo_probe_skips_descriptors_not_under_dev_dri) {
  auto root = make_proc_root("link");
  // DRM text behind a socket and a regular file is not read
  write_fdinfo(root, 60, 3, amd_client("0000:03:00.0", 1, 0), "socket:[12345]");
  write_fdinfo(root, 61, 4, amd_client("0000:03:00.0", 2, 0), "/tmp/render.log");
  write_fdinfo(root, 62, 5, amd_client("0000:03:00.0", 3, 0));
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  FdinfoGpuProbe p;
  auto t0 = FdinfoGpuProbe::Clock::now();
  ASSERT_TRUE(!p.probe_at(t0).has_value());
  write_fdinfo(root, 60, 3, amd_client("0000:03:00.0", 1, 1000000000ull), "socket:[12345]");
  write_fdinfo(root, 61, 4, amd_client("0000:03:00.0", 2, 1000000000ull), "/tmp/render.log");
  write_fdinfo(root, 62, 5, amd_client("0000:03:00.0", 3, 500000000ull));
  auto r = p.probe_at(t0 + 2s);
  ASSERT_TRUE(r.has_value());
  // Only client 3 counts: 0.5 s over 2 s
  ASSERT_TRUE(*r->utilization_percent > 24.9 && *r->utilization_percent < 25.1);
}

TEST(fdinfo_parse_rejects_non_drm_and_bad_counters) {
  ASSERT_TRUE(!FdinfoGpuProbe::parse_fdinfo("pos:\t0\nflags:\t02\n").has_value());
  auto st = FdinfoGpuProbe::parse_fdinfo("drm-driver:\ti915\n"
                                         "drm-engine-render:\t12,5 ns\n"
                                         "drm-engine-video:\t400 ns\n");
  ASSERT_TRUE(st.has_value());
  // Decimal comma is an invalid counter and is left out
  ASSERT_TRUE(st->engine_ns.find("render") == st->engine_ns.end());
  ASSERT_EQ(st->engine_ns.at("video"), 400u);
}
