#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include "collectors/GpuProbe.hpp"

namespace glance::collectors {

// Queries the NVIDIA command-line tool:
//   nvidia-smi --query-gpu=utilization.gpu,temperature.gpu --format=csv,noheader,nounits
class NvidiaSmiProbe : public IGpuProbe {
public:
  static constexpr std::chrono::milliseconds kTimeout{5000};

  explicit NvidiaSmiProbe(std::string smi_path = "nvidia-smi",
                          std::chrono::milliseconds timeout = kTimeout)
    : smi_path_(std::move(smi_path)), timeout_(timeout) {}

  const char* name() const override { return "nvidia-smi"; }
  std::optional<glance::model::GpuReading> probe() override;

  // First row whose first two fields are both numbers ("45, 62").
  static std::optional<glance::model::GpuReading> parse_output(std::string_view out);

private:
  std::string smi_path_;
  std::chrono::milliseconds timeout_;
};

} // namespace glance::collectors
