#pragma once
#include <cstdint>

namespace glance::model {

// Aggregate jiffies from the "cpu" line of /proc/stat
struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

} // namespace glance::model
