#include "app/Cli.hpp"
#include "app/Config.hpp"
#include "app/Runner.hpp"
#include "collectors/PidofResolver.hpp"
#include "collectors/ProcfsPidResolver.hpp"
#include "util/Log.hpp"

#include <cstdlib>
#include <memory>

namespace getcputime::app {

namespace {

// Points the logger at err for one invocation and puts the old sink back
class LogRedirect {
public:
  explicit LogRedirect(std::FILE* err)
      : saved_stream_(getcputime::util::log_stream()), saved_level_(getcputime::util::log_level()) {
    getcputime::util::set_log_stream(err);
  }
  ~LogRedirect() {
    getcputime::util::set_log_stream(saved_stream_);
    getcputime::util::set_log_level(saved_level_);
  }
  LogRedirect(const LogRedirect&) = delete;
  LogRedirect& operator=(const LogRedirect&) = delete;
private:
  std::FILE* saved_stream_;
  getcputime::util::LogLevel saved_level_;
};

std::unique_ptr<getcputime::collectors::IPidResolver> make_resolver(const RunConfig& cfg) {
  if (cfg.resolver == ResolverKind::Procfs)
    return std::make_unique<getcputime::collectors::ProcfsPidResolver>();
  return std::make_unique<getcputime::collectors::PidofResolver>(cfg.pidof_path);
}

} // namespace

int run_main(int argc, const char* const* argv, std::ostream& out, std::FILE* err) {
  LogRedirect redirect(err);

  CliOptions cli;
  auto parsed = parse_cli(argc, argv, cli);
  if (parsed.error != RunError::None) {
    getcputime::util::log_error("%s", parsed.message.c_str());
    std::fputs("Try 'getcputime --help' for more information.\n", err);
    return EXIT_FAILURE;
  }
  if (cli.help) {
    out << usage_text();
    return EXIT_SUCCESS;
  }

  RunConfig cfg;
  auto built = build_run_config(cli, cfg);
  if (built.error != RunError::None) {
    if (built.show_usage) std::fputs(usage_text().c_str(), err);
    else getcputime::util::log_error("%s", built.message.c_str());
    return EXIT_FAILURE;
  }

  if (cfg.verbose) getcputime::util::set_log_level(getcputime::util::LogLevel::Debug);
  else if (cfg.quiet) getcputime::util::set_log_level(getcputime::util::LogLevel::Error);

  auto resolver = make_resolver(cfg);
  Runner runner(cfg, *resolver);
  int rc = runner.run(out);
  out.flush();
  return rc;
}

} // namespace getcputime::app
