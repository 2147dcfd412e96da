#pragma once

#include <charconv>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glance::util {

inline char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

inline std::string to_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = ascii_lower(static_cast<unsigned char>(c));
  return out;
}

inline bool contains_icase(std::string_view haystack, std::string_view needle) {
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

inline std::string_view trim(std::string_view sv) {
  auto issp = [](char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  while (!sv.empty() && issp(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && issp(sv.back())) sv.remove_suffix(1);
  return sv;
}

inline std::vector<std::string_view> split(std::string_view s, char delim) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t end = s.find(delim, start);
    if (end == std::string_view::npos) end = s.size();
    out.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

// Strict decimal parse in the C locale: the whole (trimmed) field must be a
// number. "12,5", "N/A" and "[Not Supported]" are rejected.
inline std::optional<double> parse_double(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  if (s.front() == '+') s.remove_prefix(1);
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  if (!std::isfinite(v)) return std::nullopt; // "nan", "inf"
  return v;
}

inline std::optional<unsigned long long> parse_u64(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  unsigned long long v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

} // namespace glance::util
