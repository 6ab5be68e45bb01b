
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace weft::demo {

enum class TransportKind : int { MEM, WIRE };

/**
 * @ingroup demo
 * @brief Settings of the demo driver.
 */
struct Config {
  std::string app_version = "weft-demo 0.1.0";
  uint32_t tick_millis = 100;
  std::size_t thread_count = 8;
  std::size_t channel_capacity = 32;
  TransportKind transport = TransportKind::MEM;
  uint32_t tick_count = 5; //!< Ticks to observe before unsubscribing
  bool show_help = false;
  bool has_error = false;
};

std::string_view str(TransportKind kind);

void show_help(std::string_view argv0);

/**
 * @ingroup demo
 * @brief Fill a `Config` from the command line. Errors are printed, and set `has_error`.
 */
Config parse_command_line(int argc, char** argv);

} // namespace weft::demo
