#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <string_view>

namespace glance::collectors {

// "  16318748 kB" -> 16318748
static inline uint64_t parse_kb(std::string_view sv) {
  sv = glance::util::trim(sv);
  if (sv.ends_with("kB")) sv.remove_suffix(2);
  return glance::util::parse_u64(sv).value_or(0);
}

bool MemoryCollector::sample(glance::model::Memory& out) const {
  auto txt_opt = glance::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;

  uint64_t mem_total = 0, mem_free = 0, mem_avail = 0, buffers = 0, cached = 0;
  bool have_avail = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) mem_total = parse_kb(line.substr(9));
    else if (line.starts_with("MemFree:")) mem_free = parse_kb(line.substr(8));
    else if (line.starts_with("MemAvailable:")) { mem_avail = parse_kb(line.substr(13)); have_avail = true; }
    else if (line.starts_with("Buffers:")) buffers = parse_kb(line.substr(8));
    else if (line.starts_with("Cached:")) cached = parse_kb(line.substr(7));
    start = end + 1;
  }
  if (mem_total == 0) return false;

  out.total_kb = mem_total;
  if (have_avail) {
    out.used_kb = (mem_total > mem_avail) ? (mem_total - mem_avail) : 0;
  } else {
    uint64_t sum = mem_free + buffers + cached;
    out.used_kb = (mem_total > sum) ? (mem_total - sum) : 0;
  }
  out.used_pct = 100.0 * static_cast<double>(out.used_kb) / static_cast<double>(mem_total);
  return true;
}

} // namespace glance::collectors
