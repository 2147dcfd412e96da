#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"
#include <chrono>
#include <string>
#include <string_view>
#include <thread>

namespace glance::collectors {

static bool parse_cpu_line(std::string_view line, glance::model::CpuTimes& out) {
  auto pos = line.find(' ');
  if (pos == std::string_view::npos) return false;
  uint64_t vals[8]{}; int i = 0;
  for (auto field : glance::util::split(line.substr(pos + 1), ' ')) {
    if (field.empty()) continue;
    if (i == 8) break;
    auto v = glance::util::parse_u64(field);
    if (!v) return false;
    vals[i++] = *v;
  }
  // user nice system idle are mandatory; older kernels stop before steal
  if (i < 4) return false;
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
  return true;
}

std::optional<glance::model::CpuTimes> CpuCollector::read_times() const {
  auto txt_opt = glance::util::read_file_string("/proc/stat");
  if (!txt_opt) return std::nullopt;
  const std::string& txt = *txt_opt;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) {
      glance::model::CpuTimes t{};
      if (parse_cpu_line(line, t)) return t;
      return std::nullopt;
    }
    start = end + 1;
  }
  return std::nullopt;
}

std::optional<double> CpuCollector::sample() {
  auto now = read_times();
  if (!now) return std::nullopt;
  if (!has_last_) {
    // Baseline: one scheduler-visible interval is enough for a usable delta
    last_ = *now; has_last_ = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    now = read_times();
    if (!now) return std::nullopt;
  }
  double usage = 0.0;
  if (now->total() >= last_.total() && now->work() >= last_.work()) {
    auto td = now->total() - last_.total();
    auto wd = now->work()  - last_.work();
    usage = (td > 0) ? (100.0 * static_cast<double>(wd) / static_cast<double>(td)) : 0.0;
  }
  last_ = *now;
  if (usage < 0.0) usage = 0.0;
  if (usage > 100.0) usage = 100.0;
  return usage;
}

} // namespace glance::collectors
