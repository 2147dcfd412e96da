#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace glance::util {

// Flat TOML subset: [section] headers, key = value pairs, '#' comments and
// double-quoted strings. Enough for the config file; arrays and inline tables
// are not recognised.
class TomlReader {
public:
  bool load(const std::string& path);

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const;
  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const;
  [[nodiscard]] bool has(std::string_view section, std::string_view key) const;

private:
  struct Section {
    std::string name;
    std::vector<std::pair<std::string, std::string>> entries;
    [[nodiscard]] const std::string* find(std::string_view key) const;
  };

  Section& ensure_section(const std::string& name);
  [[nodiscard]] const Section* find_section(std::string_view name) const;

  std::vector<Section> sections_;
};

} // namespace glance::util
