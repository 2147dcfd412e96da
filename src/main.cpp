#include "app/EventQueue.hpp"
#include "app/HotkeyWatcher.hpp"
#include "app/OverlayController.hpp"
#include "app/Sampler.hpp"
#include "app/UiLoop.hpp"
#include "collectors/GpuCollector.hpp"
#include "collectors/SensorService.hpp"
#include "collectors/SystemCollector.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "ui/TerminalOverlay.hpp"
#include "util/Log.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace glance;

static void print_usage() {
  std::cout << "Usage: glance [-h|--help]\n"
            << "Shows CPU, memory and GPU telemetry in a terminal overlay.\n"
            << "Toggle with Ctrl+Shift+M (needs read access to /dev/input/event*).\n"
            << "Configuration: " << ui::config_file_path() << "\n";
}

int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") { print_usage(); return 0; }
    std::cerr << "glance: unknown argument: " << a << "\n";
    print_usage();
    return 2;
  }

  const auto& cfg = ui::config();
  util::set_log_level(cfg.log.level);

  std::signal(SIGINT, ui::on_stop_signal);
  std::signal(SIGTERM, ui::on_stop_signal);
  std::atexit(&ui::on_atexit_restore);

  std::cout << "System Monitor started!\n"
            << "Press Ctrl+Shift+M to show/hide system info\n"
            << "Press Ctrl+C in this window to exit\n" << std::flush;

  app::EventQueue queue;

  collectors::HwmonSensorService hwmon;
  collectors::CachedSensorService sensors(hwmon);
  collectors::GpuCollector gpu(collectors::make_default_gpu_probes(cfg.nvidia.smi_path, sensors));
  collectors::SystemCollector system(sensors, std::move(gpu));

  app::Sampler sampler(system, [&queue](const model::Snapshot& s) {
    queue.post(app::SnapshotReady{s});
  });

  app::HotkeyWatcher hotkey(cfg.hotkey.device);
  if (!hotkey.start([&queue]{ queue.post(app::ToggleRequested{}); })) {
    std::cout << "Hotkey unavailable; see the log above. Sampling continues.\n" << std::flush;
  }

  ui::TerminalOverlay overlay(cfg.ui.alt_screen && ui::tty_stdout(),
                              ui::OverlayStyle{ui::truecolor_capable(cfg.ui.truecolor)});
  app::OverlayController controller(overlay);
  app::UiLoop loop(queue, overlay, controller, ui::g_stop);

  sampler.start();
  loop.run();

  sampler.stop();
  hotkey.stop();
  controller.hide();
  std::cout << "Shutting down...\n" << std::flush;
  return 0;
}
