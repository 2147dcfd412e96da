#include "collectors/FdinfoGpuProbe.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <algorithm>
#include <set>

using namespace std::chrono;

namespace glance::collectors {

using glance::model::GpuReading;
using glance::model::GpuSource;

static bool is_number(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) if (c < '0' || c > '9') return false;
  return true;
}

// "123456 ns" -> 123456; a bare number is accepted too
static std::optional<uint64_t> parse_counter(std::string_view val) {
  val = glance::util::trim(val);
  if (val.ends_with(" ns")) val.remove_suffix(3);
  return glance::util::parse_u64(val);
}

std::optional<FdinfoGpuProbe::ClientStats> FdinfoGpuProbe::parse_fdinfo(std::string_view txt) {
  ClientStats st;
  bool is_drm = false;
  for (auto line : glance::util::split(txt, '\n')) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    auto key = glance::util::trim(line.substr(0, colon));
    auto val = glance::util::trim(line.substr(colon + 1));
    if (!key.starts_with("drm-")) continue;
    if (key == "drm-driver") { is_drm = true; continue; }
    if (key == "drm-pdev") { st.pdev = std::string(val); continue; }
    if (key == "drm-client-id") { st.client_id = std::string(val); continue; }
    if (key.starts_with("drm-engine-capacity-")) continue;
    if (key.starts_with("drm-engine-")) {
      if (auto v = parse_counter(val)) st.engine_ns[std::string(key.substr(11))] = *v;
    } else if (key.starts_with("drm-total-cycles-")) {
      if (auto v = parse_counter(val)) st.total_cycles[std::string(key.substr(17))] = *v;
    } else if (key.starts_with("drm-cycles-")) {
      if (auto v = parse_counter(val)) st.cycles[std::string(key.substr(11))] = *v;
    }
  }
  if (!is_drm) return std::nullopt;
  return st;
}

bool FdinfoGpuProbe::scan(ClientMap& out) const {
  const auto deadline = Clock::now() + kScanBudget;
  for (const auto& pd : glance::util::list_dir("/proc")) {
    if (!is_number(pd)) continue;
    if (Clock::now() > deadline) {
      GLANCE_LOG_WARN("drm fdinfo scan exceeded %lld ms", static_cast<long long>(kScanBudget.count()));
      return false;
    }
    const std::string proc_dir = "/proc/" + pd;
    for (const auto& fd : glance::util::list_dir(proc_dir + "/fd")) {
      if (!is_number(fd)) continue;
      // Only DRM device nodes carry drm-* keys; skip sockets, pipes and files
      auto target = glance::util::read_symlink(proc_dir + "/fd/" + fd);
      if (!target || !target->starts_with("/dev/dri/")) continue;
      auto txt = glance::util::read_file_string(proc_dir + "/fdinfo/" + fd);
      if (!txt || txt->find("drm-driver") == std::string::npos) continue;
      auto st = parse_fdinfo(*txt);
      if (!st) continue;
      std::string key = st->pdev + "#" + (st->client_id.empty() ? pd + "/" + fd : st->client_id);
      // dup()ed descriptors and threads report the same client
      out.try_emplace(std::move(key), std::move(*st));
    }
  }
  return true;
}

std::optional<GpuReading> FdinfoGpuProbe::probe_at(Clock::time_point now) {
  ClientMap cur;
  if (!scan(cur)) {
    has_baseline_ = false;
    last_.clear();
    return std::nullopt;
  }
  if (!has_baseline_) {
    last_ = std::move(cur); last_tp_ = now; has_baseline_ = true;
    return std::nullopt;
  }
  const double dt_ns = static_cast<double>(duration_cast<nanoseconds>(now - last_tp_).count());

  // per device, per engine
  std::map<std::string, std::map<std::string, uint64_t>> busy_ns;
  std::map<std::string, std::map<std::string, uint64_t>> cyc_delta;
  std::map<std::string, std::map<std::string, uint64_t>> total_delta;
  std::set<std::string> devices;
  for (const auto& [key, c] : cur) {
    auto it = last_.find(key);
    if (it == last_.end()) continue; // new client: no baseline yet
    const auto& p = it->second;
    devices.insert(c.pdev);
    for (const auto& [eng, ns] : c.engine_ns) {
      auto pe = p.engine_ns.find(eng);
      if (pe != p.engine_ns.end() && ns >= pe->second) busy_ns[c.pdev][eng] += ns - pe->second;
    }
    for (const auto& [eng, cy] : c.cycles) {
      auto pc = p.cycles.find(eng);
      auto tc = c.total_cycles.find(eng);
      auto ptc = p.total_cycles.find(eng);
      if (pc == p.cycles.end() || tc == c.total_cycles.end() || ptc == p.total_cycles.end()) continue;
      if (cy < pc->second || tc->second < ptc->second) continue;
      cyc_delta[c.pdev][eng] += cy - pc->second;
      // total-cycles is the device clock, identical for every client
      auto& td = total_delta[c.pdev][eng];
      td = std::max<uint64_t>(td, tc->second - ptc->second);
    }
  }
  last_ = std::move(cur); last_tp_ = now;

  if (devices.empty()) return std::nullopt;
  const std::string& dev = *devices.begin();
  double best = 0.0;
  if (dt_ns > 0) {
    for (const auto& [eng, ns] : busy_ns[dev]) best = std::max(best, 100.0 * static_cast<double>(ns) / dt_ns);
  }
  for (const auto& [eng, cy] : cyc_delta[dev]) {
    auto td = total_delta[dev][eng];
    if (td > 0) best = std::max(best, 100.0 * static_cast<double>(cy) / static_cast<double>(td));
  }
  best = std::clamp(best, 0.0, 100.0);
  GpuReading r;
  r.utilization_percent = best;
  r.source = GpuSource::OsPerformanceCounter;
  return r;
}

} // namespace glance::collectors
