#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <sys/types.h>
#include <dirent.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace glance::util {

static std::string root_from_env(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap(const std::string& abs, const std::string& root) {
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  return remap(abs, root_from_env("GLANCE_PROC_ROOT"));
}

auto map_sys_path(const std::string& abs) -> std::string {
  if (abs.rfind("/sys", 0) != 0) return abs; // not under /sys
  return remap(abs, root_from_env("GLANCE_SYS_ROOT"));
}

auto map_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) == 0) return map_proc_path(abs);
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  return abs;
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // File disappeared or became unreadable between open and read
  if (in.bad()) return std::nullopt;
  return s;
}

auto read_first_line(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs));
  if (!in) return std::nullopt;
  std::string line;
  if (!std::getline(in, line)) return std::nullopt;
  return std::string(trim(line));
}

auto read_long(const std::string& abs) -> std::optional<long long> {
  auto line = read_first_line(abs);
  if (!line || line->empty()) return std::nullopt;
  long long v = 0;
  const char* first = line->data();
  const char* last = line->data() + line->size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return v;
}

auto read_symlink(const std::string& abs) -> std::optional<std::string> {
  std::error_code ec;
  auto target = std::filesystem::read_symlink(map_path(abs), ec);
  if (ec) return std::nullopt;
  return target.string();
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

} // namespace glance::util
