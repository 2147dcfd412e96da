// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace glance::util {

// Map an absolute /proc path to an alternate root if GLANCE_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if GLANCE_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Map either prefix; other paths are returned unchanged.
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// First line of a file with surrounding whitespace removed.
auto read_first_line(const std::string& abs) -> std::optional<std::string>;

// Whole-file integer (sysfs style "12345\n"). Returns std::nullopt when the
// content is not a plain decimal integer.
auto read_long(const std::string& abs) -> std::optional<long long>;

// Target of a symlink such as /proc/<pid>/fd/<n>. Returns std::nullopt on error.
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace glance::util
