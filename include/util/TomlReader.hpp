#pragma once

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace getcputime::util {

// Flat reader for the subset of TOML the config file uses:
// [section] headers, key = value pairs, quoted strings, '#' comments.
class TomlReader {
public:
  // Returns false if the file cannot be opened. Lines that are neither a
  // header nor a key/value pair are recorded in bad_lines() and skipped.
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string text;
    std::string line;
    while (std::getline(in, line)) { text += line; text += '\n'; }
    parse(text);
    return true;
  }

  void parse(std::string_view text) {
    entries_.clear();
    bad_lines_.clear();
    std::string section;
    int lineno = 0;
    while (!text.empty()) {
      auto nl = text.find('\n');
      auto raw = text.substr(0, nl);
      text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);
      ++lineno;
      auto sv = trim(strip_comment(raw));
      if (sv.empty()) continue;
      if (sv.front() == '[') {
        if (sv.back() != ']') { bad_lines_.push_back(lineno); continue; }
        section = std::string(trim(sv.substr(1, sv.size() - 2)));
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos || eq == 0) { bad_lines_.push_back(lineno); continue; }
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      set(section, key, std::move(val));
    }
  }

  [[nodiscard]] std::optional<std::string> get_string(std::string_view section, std::string_view key) const {
    for (const auto& e : entries_)
      if (e.section == section && e.key == key) return e.value;
    return std::nullopt;
  }

  [[nodiscard]] std::optional<long> get_long(std::string_view section, std::string_view key) const {
    auto v = get_string(section, key);
    if (!v || v->empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    long n = std::strtol(v->c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return std::nullopt;
    return n;
  }

  [[nodiscard]] std::optional<bool> get_bool(std::string_view section, std::string_view key) const {
    auto v = get_string(section, key);
    if (!v) return std::nullopt;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return std::nullopt;
  }

  [[nodiscard]] const std::vector<int>& bad_lines() const { return bad_lines_; }

private:
  struct Entry { std::string section, key, value; };
  std::vector<Entry> entries_;
  std::vector<int> bad_lines_;

  void set(const std::string& section, std::string key, std::string value) {
    for (auto& e : entries_) {
      if (e.section == section && e.key == key) { e.value = std::move(value); return; }
    }
    entries_.push_back(Entry{section, std::move(key), std::move(value)});
  }

  // Drop a trailing '#' comment that is not inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace getcputime::util
