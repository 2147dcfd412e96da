#include "minitest.hpp"
#include "collectors/CpuCollector.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_cpu(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("glance_test_cpu_") + tag) / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc");
  return root;
}

TEST(cpu_collector_delta_usage) {
  auto root = make_root_cpu("delta");
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 1000 0 0 0 0\n"
                                        "cpu0 100 0 100 1000 0 0 0 0\n";
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  glance::collectors::CpuCollector c;
  // First call takes its own baseline; unchanged counters read as idle
  auto first = c.sample();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(*first >= 0.0 && *first <= 100.0);
  // +100 work on +200 total
  std::ofstream(root / "proc/stat") << "cpu  150 0 150 1100 0 0 0 0\n"
                                        "cpu0 150 0 150 1100 0 0 0 0\n";
  auto second = c.sample();
  ASSERT_TRUE(second.has_value());
  ASSERT_TRUE(*second > 49.0 && *second < 51.0);
}

TEST(cpu_collector_short_line_from_old_kernels) {
  auto root = make_root_cpu("short");
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 1000\n";
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  glance::collectors::CpuCollector c;
  ASSERT_TRUE(c.sample().has_value());
  std::ofstream(root / "proc/stat") << "cpu  200 0 100 1100\n";
  auto v = c.sample();
  ASSERT_TRUE(v.has_value());
  ASSERT_TRUE(*v > 49.0 && *v < 51.0);
}

TEST(cpu_collector_missing_stat) {
  auto root = make_root_cpu("missing");
  fs::remove(root / "proc/stat");
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  glance::collectors::CpuCollector c;
  ASSERT_TRUE(!c.sample().has_value());
}

TEST(cpu_collector_malformed_stat) {
  auto root = make_root_cpu("garbage");
  std::ofstream(root / "proc/stat") << "cpu  abc def\n";
  setenv("GLANCE_PROC_ROOT", root.c_str(), 1);
  glance::collectors::CpuCollector c;
  ASSERT_TRUE(!c.sample().has_value());
}
