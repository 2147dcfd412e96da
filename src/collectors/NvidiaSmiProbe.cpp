#include "collectors/NvidiaSmiProbe.hpp"
#include "util/Log.hpp"
#include "util/Strings.hpp"
#include "util/Subprocess.hpp"

namespace glance::collectors {

using glance::model::GpuReading;
using glance::model::GpuSource;

std::optional<GpuReading> NvidiaSmiProbe::parse_output(std::string_view out) {
  for (auto line : glance::util::split(out, '\n')) {
    line = glance::util::trim(line);
    if (line.empty()) continue;
    auto fields = glance::util::split(line, ',');
    // Exactly the two queried columns; a decimal comma adds a third
    if (fields.size() != 2) continue;
    // "[Not Supported]" and "N/A" fail here and the row is skipped
    auto util = glance::util::parse_double(fields[0]);
    auto temp = glance::util::parse_double(fields[1]);
    if (!util || !temp) continue;
    if (*util < 0.0 || *util > 100.0) continue;
    GpuReading r;
    r.utilization_percent = *util;
    r.temperature_c = *temp;
    r.source = GpuSource::PrimaryTool;
    return r;
  }
  return std::nullopt;
}

std::optional<GpuReading> NvidiaSmiProbe::probe() {
  auto res = glance::util::run_command({smi_path_,
                                        "--query-gpu=utilization.gpu,temperature.gpu",
                                        "--format=csv,noheader,nounits"},
                                       timeout_);
  if (!res.launched) {
    GLANCE_LOG_ONCE(glance::util::LogLevel::Info, "nvidia-smi-launch",
                    "nvidia-smi unavailable (%s)", res.error.c_str());
    return std::nullopt;
  }
  if (res.timed_out) {
    GLANCE_LOG_WARN("nvidia-smi timed out after %lld ms", static_cast<long long>(timeout_.count()));
    return std::nullopt;
  }
  if (res.exit_code != 0) {
    GLANCE_LOG_DEBUG("nvidia-smi exited with %d", res.exit_code);
    return std::nullopt;
  }
  auto r = parse_output(res.out);
  if (!r) GLANCE_LOG_DEBUG("nvidia-smi output not usable");
  return r;
}

} // namespace glance::collectors
