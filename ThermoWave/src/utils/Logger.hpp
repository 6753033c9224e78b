#pragma once
#include <cstdint>
#include <sstream>
#include <string>

namespace logger {
  // Returns ms since program start (steady clock).
  uint64_t ms_since_start();

  // True if VERBOSE env var is set and not "0".
  bool verbose();

  // Per-thread label used in log lines (defaults to "main").
  extern thread_local const char* tlabel;

  // Installs the spdlog console logger + pattern. Called lazily by the
  // writers below, call it explicitly from main() to log config at startup.
  void init();

  void write_info(const std::string& line);
  void write_warn(const std::string& line);
  void write_error(const std::string& line);
  void write_debug(const std::string& line);
}

// Stream-style macros, e.g. LOG_ALWAYS("tick " << k << " overran").
#define LOG_WITH_(writer, msg) do { \
  std::ostringstream log_oss_; \
  log_oss_ << msg; \
  writer(log_oss_.str()); \
} while(0)

#define LOG_ALWAYS(msg) LOG_WITH_(logger::write_info, msg)
#define LOG_WARN(msg)   LOG_WITH_(logger::write_warn, msg)
#define LOG_ERR(msg)    LOG_WITH_(logger::write_error, msg)
#define LOG_DBG(msg) do { if (logger::verbose()) LOG_WITH_(logger::write_debug, msg); } while(0)
