#pragma once

#include <cstdio>
#include <ostream>

namespace getcputime::app {

// Whole command line: parse, configure, run. Reports and notices go to out;
// usage, hints and log lines go to err. Returns the process exit status.
int run_main(int argc, const char* const* argv, std::ostream& out, std::FILE* err);

} // namespace getcputime::app
