#include "collectors/SensorService.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <algorithm>
#include <filesystem>

namespace glance::collectors {

using glance::model::SensorChannel;
using glance::model::SensorKind;

namespace {

// "temp12_input" with prefix "temp" and suffix "_input" -> 12
std::optional<int> attr_index(const std::string& name, std::string_view prefix, std::string_view suffix) {
  if (name.size() <= prefix.size() + suffix.size()) return std::nullopt;
  if (name.rfind(prefix, 0) != 0 || !std::string_view(name).ends_with(suffix)) return std::nullopt;
  auto digits = std::string_view(name).substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  auto v = glance::util::parse_u64(digits);
  if (!v) return std::nullopt;
  return static_cast<int>(*v);
}

// hwmon0, hwmon2, hwmon10 in numeric order
std::vector<std::string> sorted_hwmon_dirs(const std::string& base) {
  std::vector<std::pair<int, std::string>> idx;
  for (auto& e : glance::util::list_dir(base)) {
    if (e.rfind("hwmon", 0) != 0) continue;
    if (auto n = glance::util::parse_u64(std::string_view(e).substr(5))) idx.emplace_back(static_cast<int>(*n), e);
  }
  std::sort(idx.begin(), idx.end());
  std::vector<std::string> out;
  out.reserve(idx.size());
  for (auto& p : idx) out.push_back(std::move(p.second));
  return out;
}

std::string channel_label(const std::string& dir, const std::string& stem) {
  auto lbl = glance::util::read_first_line(dir + "/" + stem + "_label");
  if (lbl && !lbl->empty()) return *lbl;
  return stem;
}

struct KindSpec {
  const char* prefix;
  const char* suffix;
  SensorKind kind;
  double scale;
};

// powerN_average is preferred over powerN_input when both exist
constexpr KindSpec kSpecs[] = {
  {"temp",  "_input",   SensorKind::Temperature, 1.0 / 1000.0},
  {"fan",   "_input",   SensorKind::Fan,         1.0},
  {"power", "_average", SensorKind::Power,       1.0 / 1000000.0},
  {"power", "_input",   SensorKind::Power,       1.0 / 1000000.0},
};

void read_chip(const std::string& dir, std::vector<SensorChannel>& out) {
  auto chip = glance::util::read_first_line(dir + "/name").value_or("");
  if (chip.empty()) chip = std::filesystem::path(dir).filename().string();
  auto entries = glance::util::list_dir(dir);

  for (const auto& spec : kSpecs) {
    std::vector<int> indices;
    for (const auto& e : entries) {
      if (auto n = attr_index(e, spec.prefix, spec.suffix)) indices.push_back(*n);
    }
    std::sort(indices.begin(), indices.end());
    for (int n : indices) {
      std::string stem = std::string(spec.prefix) + std::to_string(n);
      if (spec.kind == SensorKind::Power && std::string_view(spec.suffix) == "_input") {
        bool has_average = std::find(entries.begin(), entries.end(), stem + "_average") != entries.end();
        if (has_average) continue;
      }
      auto raw = glance::util::read_long(dir + "/" + stem + spec.suffix);
      if (!raw) continue; // disabled sensors return EIO/ENODATA
      out.push_back(SensorChannel{chip, channel_label(dir, stem), spec.kind,
                                  static_cast<double>(*raw) * spec.scale});
    }
  }

  // amdgpu exposes engine load on the PCI device rather than the hwmon node
  if (auto busy = glance::util::read_long(dir + "/device/gpu_busy_percent")) {
    out.push_back(SensorChannel{chip, "busy", SensorKind::Load, static_cast<double>(*busy)});
  }
}

} // namespace

std::optional<std::vector<SensorChannel>> HwmonSensorService::query() {
  const std::string base = "/sys/class/hwmon";
  std::error_code ec;
  if (!std::filesystem::is_directory(glance::util::map_sys_path(base), ec)) return std::nullopt;
  std::vector<SensorChannel> out;
  for (const auto& d : sorted_hwmon_dirs(base)) read_chip(base + "/" + d, out);
  return out;
}

const std::optional<std::vector<SensorChannel>>& CachedSensorService::refresh() {
  last_ = inner_.query();
  fresh_ = true;
  return last_;
}

std::optional<std::vector<SensorChannel>> CachedSensorService::query() {
  if (!fresh_) refresh();
  return last_;
}

} // namespace glance::collectors
