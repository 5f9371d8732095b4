// Fake /proc trees for tests; paths are remapped via GETCPUTIME_PROC_ROOT
#pragma once
#include "util/Log.hpp"

#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace testutil {

namespace fs = std::filesystem;

// Fresh empty tree under the temp dir, installed as the procfs root
inline fs::path make_proc_root(const std::string& tag) {
  auto root = fs::temp_directory_path() / fs::path("getcputime_test_" + tag + "_" + std::to_string(::getpid()));
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root / "proc");
  ::setenv("GETCPUTIME_PROC_ROOT", root.c_str(), 1);
  return root;
}

inline std::string stat_line(int32_t pid, const std::string& comm, uint64_t utime, uint64_t stime) {
  // fields 1..24: pid comm state ppid pgrp session tty tpgid flags minflt cminflt majflt cmajflt
  //               utime stime cutime cstime priority nice threads itreal starttime vsize rss
  return std::to_string(pid) + " (" + comm + ") S 1 " + std::to_string(pid) + " " + std::to_string(pid) +
         " 0 -1 4194560 100 0 0 0 " + std::to_string(utime) + " " + std::to_string(stime) +
         " 0 0 20 0 1 0 100 1000000 200\n";
}

inline void write_stat(const fs::path& root, int32_t pid, const std::string& comm, uint64_t utime, uint64_t stime) {
  auto dir = root / "proc" / std::to_string(pid);
  fs::create_directories(dir);
  std::ofstream(dir / "stat") << stat_line(pid, comm, utime, stime);
}

inline void write_cmdline(const fs::path& root, int32_t pid, const std::string& nul_separated) {
  auto dir = root / "proc" / std::to_string(pid);
  fs::create_directories(dir);
  std::ofstream out(dir / "cmdline", std::ios::binary);
  out.write(nul_separated.data(), static_cast<std::streamsize>(nul_separated.size()));
}

inline void remove_pid(const fs::path& root, int32_t pid) {
  std::error_code ec;
  fs::remove_all(root / "proc" / std::to_string(pid), ec);
}

// Collects log output for the lifetime of the object
class LogCapture {
public:
  explicit LogCapture(getcputime::util::LogLevel level = getcputime::util::LogLevel::Warn)
      : saved_(getcputime::util::log_level()), file_(std::tmpfile()) {
    getcputime::util::set_log_level(level);
    getcputime::util::set_log_stream(file_);
  }
  ~LogCapture() {
    getcputime::util::set_log_stream(nullptr);
    getcputime::util::set_log_level(saved_);
    if (file_) std::fclose(file_);
  }
  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  std::string text() const {
    std::string out;
    if (!file_) return out;
    std::fflush(file_);
    std::rewind(file_);
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), file_)) > 0) out.append(buf, n);
    std::fseek(file_, 0, SEEK_END);
    return out;
  }
private:
  getcputime::util::LogLevel saved_;
  std::FILE* file_;
};

} // namespace testutil
