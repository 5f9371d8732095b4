// C++23 helpers for reading /proc with optional root remap
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace getcputime::util {

// Map an absolute /proc path to an alternate root if GETCPUTIME_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read entire file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>>;

// Resolve a symlink target (e.g. /proc/<pid>/exe). Returns std::nullopt on error.
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// "/proc/<pid>/<leaf>"
auto pid_path(int32_t pid, const char* leaf) -> std::string;

} // namespace getcputime::util
