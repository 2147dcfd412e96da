#pragma once

#include <string>
#include "util/Log.hpp"

namespace glance::ui {

struct Config {
  struct Log {
    glance::util::LogLevel level{glance::util::LogLevel::Warn};
  } log;
  struct Nvidia {
    std::string smi_path{"nvidia-smi"};
  } nvidia;
  struct Hotkey {
    std::string device; // empty: every keyboard-capable evdev node
  } hotkey;
  struct Ui {
    bool alt_screen{true};
    int  truecolor{-1}; // -1 auto (COLORTERM), 0 off, 1 on
  } ui;
};

// Process-wide configuration, resolved once on first use.
const Config& config();

// Resolve a configuration from `path` (may be empty or missing), then
// environment, then compiled defaults.
Config load_config(const std::string& path);

// $XDG_CONFIG_HOME/glance/config.toml or ~/.config/glance/config.toml
std::string config_file_path();

// Environment variable helpers
const char* getenv_compat(const char* name);
bool env_flag(const char* name, bool defv);

} // namespace glance::ui
