
#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>
#include <string_view>

namespace weft::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/// @private
static spdlog::level::level_enum to_spdlog_level(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE: return spdlog::level::trace;
  case LogLevel::DEBUG: return spdlog::level::debug;
  case LogLevel::INFO: return spdlog::level::info;
  case LogLevel::WARN: return spdlog::level::warn;
  case LogLevel::ERROR: return spdlog::level::err;
  case LogLevel::FATAL: return spdlog::level::critical;
  }
  return spdlog::level::warn;
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, []() {
    instance = spdlog::stdout_color_mt("weft");
    instance->set_pattern("[%Y-%m-%d %T] [%^%l%$] %v");

#ifdef DEBUG_BUILD
    instance->set_level(spdlog::level::trace);
#else
    instance->set_level(spdlog::level::warn);
#endif

    const char* env_variable = "LOG_LEVEL_OVERRIDE";
    const char* log_level = std::getenv(env_variable);
    if (log_level) {
      const auto level = spdlog::level::from_str(log_level);
      if (level == spdlog::level::off && log_level != std::string_view{"off"}) {
        instance->error("failed to set log level from environment variable {}={}", env_variable,
                        log_level);
      } else {
        instance->set_level(level);
      }
    }
  });

  assert(instance);
  return *instance;
}

/**
 * @ingroup logging
 */
void set_log_level(LogLevel level) { debug_logger().set_level(to_spdlog_level(level)); }

} // namespace weft::logging
