#include "ui/Config.hpp"
#include "util/Strings.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <string>

namespace glance::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("GLANCE_", 0) == 0) {
    alt = std::string("glance_") + n.substr(7);
  } else if (n.rfind("glance_", 0) == 0) {
    alt = std::string("GLANCE_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/glance/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/glance/config.toml";
  return {};
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const glance::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const glance::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  glance::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [log] ---
  auto level = resolve_string(toml, have_toml, "log", "level", "GLANCE_LOG_LEVEL", "warn");
  c.log.level = glance::util::parse_log_level(level, glance::util::LogLevel::Warn);

  // --- [nvidia] ---
  c.nvidia.smi_path = resolve_string(toml, have_toml, "nvidia", "smi_path", "GLANCE_NVIDIA_SMI_PATH", "nvidia-smi");
  if (c.nvidia.smi_path.empty()) c.nvidia.smi_path = "nvidia-smi";

  // --- [hotkey] ---
  c.hotkey.device = resolve_string(toml, have_toml, "hotkey", "device", "GLANCE_HOTKEY_DEVICE", "");

  // --- [ui] ---
  c.ui.alt_screen = resolve_bool(toml, have_toml, "ui", "alt_screen", "GLANCE_ALT_SCREEN", true);
  auto tc = glance::util::to_lower(resolve_string(toml, have_toml, "ui", "truecolor", "GLANCE_TRUECOLOR", "auto"));
  if (tc == "true" || tc == "1" || tc == "on") c.ui.truecolor = 1;
  else if (tc == "false" || tc == "0" || tc == "off") c.ui.truecolor = 0;
  else c.ui.truecolor = -1;

  return c;
}

const Config& config() {
  static Config cfg = load_config(config_file_path());
  return cfg;
}

} // namespace glance::ui
