#include "app/Config.hpp"
#include "util/Env.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <utility>

namespace getcputime::app {

std::string usage_text() {
  return "Usage: getcputime [options] <process_name> <sleep_duration>\n"
         "Report CPU usage (user and system) of all processes named <process_name>\n"
         "over <sleep_duration> seconds.\n"
         "\n"
         "Options:\n"
         "  -h, --help               show this help and exit\n"
         "  -v, --verbose            debug output on stderr (per-process deltas)\n"
         "  -q, --quiet              suppress warnings\n"
         "      --resolver=KIND      pidof (default) or procfs\n"
         "      --measure-elapsed    divide by measured wall time, not the nominal duration\n"
         "      --config=PATH        read settings from PATH\n";
}

ConfigResult parse_cli(int argc, const char* const* argv, CliOptions& out) {
  bool options_done = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (options_done || a.empty() || a[0] != '-' || a == "-") { out.positional.push_back(a); continue; }
    if (a == "--") { options_done = true; continue; }
    if (a == "-h" || a == "--help") out.help = true;
    else if (a == "-v" || a == "--verbose") out.verbose = true;
    else if (a == "-q" || a == "--quiet") out.quiet = true;
    else if (a == "--measure-elapsed") out.measure_elapsed = true;
    else if (a.rfind("--resolver", 0) == 0) {
      std::string v;
      if (a.size() > 10 && a[10] == '=') v = a.substr(11);
      else if (a.size() == 10 && i + 1 < argc) v = argv[++i];
      else return {RunError::Usage, "unknown option '" + a + "'"};
      auto kind = parse_resolver_kind(v);
      if (!kind) return {RunError::Usage, "unknown resolver '" + v + "' (expected pidof or procfs)"};
      out.resolver = kind;
    }
    else if (a.rfind("--config", 0) == 0) {
      if (a.size() > 8 && a[8] == '=') out.config_path = a.substr(9);
      else if (a.size() == 8 && i + 1 < argc) out.config_path = std::string(argv[++i]);
      else return {RunError::Usage, "option '--config' needs a path"};
    }
    else return {RunError::Usage, "unknown option '" + a + "'"};
  }
  return {};
}

bool parse_seconds(std::string_view text, unsigned& out) {
  if (text.empty()) return false;
  for (char c : text) if (c < '0' || c > '9') return false;
  unsigned v = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc() || ptr != text.data() + text.size()) return false;
  if (v == 0) return false;
  out = v;
  return true;
}

std::optional<ResolverKind> parse_resolver_kind(std::string_view text) {
  auto s = getcputime::util::ascii_lower(std::string(text));
  if (s == "pidof") return ResolverKind::Pidof;
  if (s == "procfs" || s == "proc") return ResolverKind::Procfs;
  return std::nullopt;
}

const char* resolver_kind_name(ResolverKind kind) {
  return kind == ResolverKind::Procfs ? "procfs" : "pidof";
}

std::string config_file_path() {
  if (const char* p = getcputime::util::getenv_compat("GETCPUTIME_CONFIG")) return std::string(p);
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/getcputime/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/getcputime/config.toml";
  return {};
}

void apply_toml(const getcputime::util::TomlReader& toml, RunConfig& cfg) {
  if (auto v = toml.get_string("resolve", "method")) {
    if (auto kind = parse_resolver_kind(*v)) cfg.resolver = *kind;
    else getcputime::util::log_warn("config: unknown resolve.method '%s', keeping %s",
                                    v->c_str(), resolver_kind_name(cfg.resolver));
  }
  if (auto v = toml.get_string("resolve", "pidof_path")) cfg.pidof_path = *v;
  if (auto v = toml.get_bool("sampling", "measure_elapsed")) cfg.measure_elapsed = *v;
  if (toml.get_string("sampling", "clk_tck")) {
    auto hz = toml.get_long("sampling", "clk_tck");
    cfg.clk_tck = hz ? *hz : -1;
  }
  if (auto v = toml.get_bool("log", "verbose")) cfg.verbose = *v;
  if (auto v = toml.get_bool("log", "quiet")) cfg.quiet = *v;
}

void apply_env(RunConfig& cfg) {
  using getcputime::util::getenv_compat;
  if (const char* v = getenv_compat("GETCPUTIME_RESOLVER")) {
    if (auto kind = parse_resolver_kind(v)) cfg.resolver = *kind;
    else getcputime::util::log_warn("GETCPUTIME_RESOLVER: unknown resolver '%s'", v);
  }
  if (const char* v = getenv_compat("GETCPUTIME_PIDOF_PATH")) cfg.pidof_path = v;
  if (getenv_compat("GETCPUTIME_CLK_TCK")) {
    auto hz = getcputime::util::getenv_long("GETCPUTIME_CLK_TCK");
    cfg.clk_tck = hz ? *hz : -1;
  }
  cfg.measure_elapsed = getcputime::util::env_flag("GETCPUTIME_MEASURE_ELAPSED", cfg.measure_elapsed);
  cfg.verbose = getcputime::util::env_flag("GETCPUTIME_VERBOSE", cfg.verbose);
  cfg.quiet = getcputime::util::env_flag("GETCPUTIME_QUIET", cfg.quiet);
}

ConfigResult build_run_config(const CliOptions& cli, RunConfig& out) {
  if (cli.positional.size() < 2) return {RunError::Usage, "missing arguments", true};
  if (cli.positional.size() > 2) return {RunError::Usage, "unexpected argument '" + cli.positional[2] + "'"};
  if (cli.positional[0].empty()) return {RunError::Usage, "process_name must not be empty", true};

  RunConfig cfg;
  cfg.process_name = cli.positional[0];
  if (!parse_seconds(cli.positional[1], cfg.seconds))
    return {RunError::Usage, "sleep_duration must be a positive integer"};

  std::string path = cli.config_path ? *cli.config_path : config_file_path();
  if (!path.empty()) {
    getcputime::util::TomlReader toml;
    if (toml.load(path)) {
      for (int line : toml.bad_lines())
        getcputime::util::log_warn("config: %s:%d: not a key = value line, ignored", path.c_str(), line);
      apply_toml(toml, cfg);
    } else if (cli.config_path) {
      return {RunError::Environment, "cannot read config file '" + path + "'"};
    }
  }
  apply_env(cfg);

  if (cli.resolver) cfg.resolver = *cli.resolver;
  if (cli.measure_elapsed) cfg.measure_elapsed = true;
  if (cli.verbose) cfg.verbose = true;
  if (cli.quiet) cfg.quiet = true;

  out = std::move(cfg);
  return {};
}

} // namespace getcputime::app
