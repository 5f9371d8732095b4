#pragma once
#include "collectors/IPidResolver.hpp"

namespace getcputime::collectors {

// Runs the OS `pidof` command and parses its space-separated pid list.
class PidofResolver : public IPidResolver {
public:
  // Empty pidof_path: search GETCPUTIME_PIDOF_PATH, PATH, then sbin/bin defaults
  explicit PidofResolver(std::string pidof_path = {});
  std::optional<std::vector<int32_t>> resolve(const std::string& name) override;
  const char* name() const override { return "pidof"; }

  // Parse pidof stdout ("812 77 4051\n"); non-numeric tokens are ignored.
  static std::vector<int32_t> parse_pid_list(const std::string& text);
  // Single-quote a word for /bin/sh
  static std::string shell_quote(const std::string& word);
private:
  std::string pidof_path_;

  std::string find_pidof() const;
};

} // namespace getcputime::collectors
