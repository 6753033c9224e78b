#include "Logger.hpp"
#include <chrono>
#include <cstdlib>
#include <string_view>
#include <mutex>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
  const auto g_t0 = std::chrono::steady_clock::now();
  std::once_flag g_init_once;
}

namespace logger {
  thread_local const char* tlabel = "main";

  uint64_t ms_since_start() {
    return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_t0).count());
  }

  bool verbose() {
    const char* v = std::getenv("VERBOSE");
    return v && *v && std::string_view(v) != "0";
  }

  void init() {
    std::call_once(g_init_once, []() {
      // spdlog loggers are thread safe (_mt), no extra mutex needed here
      auto console = spdlog::stdout_color_mt("thermowave");
      spdlog::set_default_logger(console);
      spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
      spdlog::set_level(verbose() ? spdlog::level::debug : spdlog::level::info);
      spdlog::flush_on(spdlog::level::warn);
    });
  }

  void write_info(const std::string& line) {
    init();
    spdlog::info("[{:>6} ms] {}: {}", ms_since_start(), tlabel, line);
  }

  void write_warn(const std::string& line) {
    init();
    spdlog::warn("[{:>6} ms] {}: {}", ms_since_start(), tlabel, line);
  }

  void write_error(const std::string& line) {
    init();
    spdlog::error("[{:>6} ms] {}: {}", ms_since_start(), tlabel, line);
  }

  void write_debug(const std::string& line) {
    init();
    spdlog::debug("[{:>6} ms] {}: {}", ms_since_start(), tlabel, line);
  }
}
