#pragma once
#include <optional>
#include <string>

namespace getcputime::util {

// getenv that ignores empty values and also accepts the lowercase
// "getcputime_" spelling of a "GETCPUTIME_" variable (and vice versa).
const char* getenv_compat(const char* name);

// Integer value of an environment variable; std::nullopt when unset or not a number.
std::optional<long> getenv_long(const char* name);

// Boolean flag: "0", "f..", "n.." and "off" are false, anything else set is true.
bool env_flag(const char* name, bool defv);

// Lowercased copy for case-insensitive keyword matching.
std::string ascii_lower(std::string s);

} // namespace getcputime::util
