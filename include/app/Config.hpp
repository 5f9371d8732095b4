#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace getcputime::util { class TomlReader; }

namespace getcputime::app {

enum class ResolverKind { Pidof, Procfs };

// Why a run stopped early. Usage and Environment go to stderr; NotFound is
// reported on stdout as "nothing to do".
enum class RunError { None, Usage, Environment, NotFound };

struct RunConfig {
  std::string process_name;
  unsigned seconds{0};
  ResolverKind resolver{ResolverKind::Pidof};
  std::string pidof_path;        // empty = search
  long clk_tck{0};               // 0 = sysconf(_SC_CLK_TCK), <0 = invalid override
  bool measure_elapsed{false};   // normalize by measured wall time instead of nominal
  bool verbose{false};
  bool quiet{false};
};

// Command line as typed, before defaults/file/env are merged in
struct CliOptions {
  std::vector<std::string> positional;
  std::optional<std::string> config_path;
  std::optional<ResolverKind> resolver;
  bool verbose{false};
  bool quiet{false};
  bool measure_elapsed{false};
  bool help{false};
};

struct ConfigResult {
  RunError error{RunError::None};
  std::string message; // set when error != None
  bool show_usage{false};
};

[[nodiscard]] std::string usage_text();

// Flag syntax only; positional arguments are checked in build_run_config.
[[nodiscard]] ConfigResult parse_cli(int argc, const char* const* argv, CliOptions& out);

// "^[0-9]+$", greater than zero, fits in unsigned
[[nodiscard]] bool parse_seconds(std::string_view text, unsigned& out);

[[nodiscard]] std::optional<ResolverKind> parse_resolver_kind(std::string_view text);
[[nodiscard]] const char* resolver_kind_name(ResolverKind kind);

// $GETCPUTIME_CONFIG, $XDG_CONFIG_HOME/getcputime/config.toml, ~/.config/getcputime/config.toml
[[nodiscard]] std::string config_file_path();

// Layers: compiled defaults < config file < environment < command line.
[[nodiscard]] ConfigResult build_run_config(const CliOptions& cli, RunConfig& out);

void apply_toml(const getcputime::util::TomlReader& toml, RunConfig& cfg);
void apply_env(RunConfig& cfg);

} // namespace getcputime::app
