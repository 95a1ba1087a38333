#pragma once

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

class Logger {
 public:
  enum class Level { Debug, Info, Warn, Error };

  Logger() : started_(std::chrono::steady_clock::now()) {}

  void enable_file(const std::filesystem::path& path) {
    file_.open(path, std::ios::binary | std::ios::trunc);
  }

  void set_debug(bool enabled) { debug_enabled_ = enabled; }
  bool debug_enabled() const { return debug_enabled_; }

  // Quiet loggers still write to the log file, only stderr is muted.
  void set_quiet(bool quiet) { quiet_ = quiet; }

  void log(Level level, const std::string& msg) {
    if (level == Level::Debug && !debug_enabled_) return;
    const std::string line = format(level, msg);
    if (!quiet_) std::cerr << line;
    if (file_.is_open()) file_ << line;
  }

  void info(const std::string& msg) { log(Level::Info, msg); }
  void warn(const std::string& msg) { log(Level::Warn, msg); }
  void error(const std::string& msg) { log(Level::Error, msg); }
  void debug(const std::string& msg) { log(Level::Debug, msg); }

 private:
  static const char* level_tag(Level l) {
    switch (l) {
      case Level::Debug:
        return "DEBUG";
      case Level::Info:
        return "INFO";
      case Level::Warn:
        return "WARN";
      case Level::Error:
        return "ERROR";
    }
    return "INFO";
  }

  std::string format(Level l, const std::string& msg) const {
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "+%.2fs ", elapsed);

    std::string out;
    out.reserve(msg.size() + 32);
    out += "[";
    out += level_tag(l);
    out += "] ";
    out += stamp;
    out += msg;
    if (out.empty() || out.back() != '\n') out.push_back('\n');
    return out;
  }

  bool debug_enabled_ = false;
  bool quiet_ = false;
  std::chrono::steady_clock::time_point started_;
  std::ofstream file_;
};
