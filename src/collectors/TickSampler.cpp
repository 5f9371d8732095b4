#include "collectors/TickSampler.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace getcputime::collectors {

static bool parse_u64(std::string_view tok, uint64_t& out) {
  auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), out);
  return ec == std::errc() && ptr == tok.data() + tok.size();
}

std::optional<getcputime::model::CpuTicks> parse_stat_record(const std::string& content) {
  // comm (field 2) is "(...)" and may itself contain spaces or ')'
  auto lp = content.find('(');
  auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp) return std::nullopt;

  // Split the fields after comm; tokens[0] is field 3 (state)
  std::vector<std::string_view> tokens;
  std::string_view rest(content);
  rest.remove_prefix(rp + 1);
  size_t start = 0;
  while (start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t' || rest[start] == '\n')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] != ' ' && rest[end] != '\t' && rest[end] != '\n') ++end;
    if (end > start) tokens.push_back(rest.substr(start, end - start));
    start = end;
  }
  constexpr size_t utime_idx = kUtimeField - kStateField;
  constexpr size_t stime_idx = kStimeField - kStateField;
  if (tokens.size() <= stime_idx) return std::nullopt;

  getcputime::model::CpuTicks t{};
  if (!parse_u64(tokens[utime_idx], t.user)) return std::nullopt;
  if (!parse_u64(tokens[stime_idx], t.system)) return std::nullopt;
  return t;
}

getcputime::model::CpuSnapshot TickSampler::sample(const std::vector<int32_t>& pids) const {
  getcputime::model::CpuSnapshot snap;
  snap.ticks.reserve(pids.size());
  for (auto pid : pids) {
    auto path = getcputime::util::pid_path(pid, "stat");
    auto content = getcputime::util::read_file_string(path);
    std::optional<getcputime::model::CpuTicks> ticks;
    if (content) ticks = parse_stat_record(*content);
    if (!ticks) {
      getcputime::util::log_warn("cannot read %s, process may have terminated", path.c_str());
      snap.skipped.push_back(pid);
      continue;
    }
    snap.ticks[pid] = *ticks;
  }
  return snap;
}

} // namespace getcputime::collectors
