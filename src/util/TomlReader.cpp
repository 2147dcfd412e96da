#include "util/TomlReader.hpp"
#include "util/Strings.hpp"

#include <fstream>

namespace glance::util {

bool TomlReader::load(const std::string& path) {
  sections_.clear();
  std::ifstream in(path);
  if (!in.is_open()) return false;
  std::string current;
  std::string line;
  while (std::getline(in, line)) {
    auto sv = trim(line);
    if (sv.empty() || sv[0] == '#') continue;
    if (sv.front() == '[' && sv.back() == ']') {
      current = std::string(trim(sv.substr(1, sv.size() - 2)));
      ensure_section(current);
      continue;
    }
    auto eq = sv.find('=');
    if (eq == std::string_view::npos) continue;
    std::string key(trim(sv.substr(0, eq)));
    auto val = trim(sv.substr(eq + 1));
    if (val.size() >= 2 && val.front() == '"') {
      // Quoted string; anything after the closing quote is a comment
      auto close = val.find('"', 1);
      val = (close == std::string_view::npos) ? val.substr(1) : val.substr(1, close - 1);
    } else if (auto hash = val.find('#'); hash != std::string_view::npos) {
      val = trim(val.substr(0, hash));
    }
    auto& sec = ensure_section(current);
    bool replaced = false;
    for (auto& [k, v] : sec.entries) {
      if (k == key) { v = std::string(val); replaced = true; break; }
    }
    if (!replaced) sec.entries.emplace_back(std::move(key), std::string(val));
  }
  return true;
}

std::string TomlReader::get_string(std::string_view section, std::string_view key,
                                   const std::string& def) const {
  const auto* s = find_section(section);
  if (!s) return def;
  const auto* v = s->find(key);
  return v ? *v : def;
}

bool TomlReader::get_bool(std::string_view section, std::string_view key, bool def) const {
  const auto* s = find_section(section);
  const auto* v = s ? s->find(key) : nullptr;
  if (!v || v->empty()) return def;
  auto lower = to_lower(*v);
  if (lower == "true" || lower == "1") return true;
  if (lower == "false" || lower == "0") return false;
  return def;
}

bool TomlReader::has(std::string_view section, std::string_view key) const {
  const auto* s = find_section(section);
  return s && s->find(key);
}

const std::string* TomlReader::Section::find(std::string_view key) const {
  for (const auto& [k, v] : entries)
    if (k == key) return &v;
  return nullptr;
}

TomlReader::Section& TomlReader::ensure_section(const std::string& name) {
  for (auto& s : sections_)
    if (s.name == name) return s;
  sections_.push_back(Section{name, {}});
  return sections_.back();
}

const TomlReader::Section* TomlReader::find_section(std::string_view name) const {
  for (const auto& s : sections_)
    if (s.name == name) return &s;
  return nullptr;
}

} // namespace glance::util
