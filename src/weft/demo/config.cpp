
#include "stdinc.hpp"

#include "config.hpp"

#include "weft/utils/cli-utils.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace weft::demo {

std::string_view str(TransportKind kind) {
  switch (kind) {
  case TransportKind::MEM: return "mem";
  case TransportKind::WIRE: return "wire";
  }
  return "<unknown>";
}

void show_help(std::string_view argv0) {
  fmt::print(R"V0G0N(

   Usage: {0} [OPTIONS...]

      Runs the demo app server, and exercises every call through a client.

   Options:

      --app-version <string>   Version string that AppVersion answers with.
      --tick-ms <integer>      Clock period, in milliseconds. Default is 100.
      --threads <integer>      Size of the thread pool. Default is 8.
      --capacity <integer>     Messages buffered per channel direction. Default is 32.
      --transport <mem|wire>   In-process typed messages, or encoded frames. Default is mem.
      --ticks <integer>        Number of clock ticks to observe. Default is 5.

   Examples:

      # Run the demo, with every message encoded
      > {0} --transport wire --ticks 3

)V0G0N",
             argv0);
}

Config parse_command_line(int argc, char** argv) {
  Config config;

  auto positive = [](int value, std::string_view arg) {
    if (value <= 0)
      throw std::runtime_error(format("expected a positive integer after '{}'", arg));
    return value;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      config.show_help = true;
      return config; // no need to look at other switches
    }
  }

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg = argv[i];
      if (arg == "--app-version") {
        config.app_version = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--tick-ms") {
        config.tick_millis = uint32_t(positive(cli::safe_arg_int(argc, argv, i), arg));
      } else if (arg == "--threads") {
        config.thread_count = std::size_t(positive(cli::safe_arg_int(argc, argv, i), arg));
      } else if (arg == "--capacity") {
        config.channel_capacity = std::size_t(positive(cli::safe_arg_int(argc, argv, i), arg));
      } else if (arg == "--transport") {
        const auto kind = cli::safe_arg_str(argc, argv, i);
        if (kind == "mem")
          config.transport = TransportKind::MEM;
        else if (kind == "wire")
          config.transport = TransportKind::WIRE;
        else
          throw std::runtime_error(format("unknown transport '{}'", kind));
      } else if (arg == "--ticks") {
        config.tick_count = uint32_t(positive(cli::safe_arg_int(argc, argv, i), arg));
      } else {
        throw std::runtime_error(format("unknown argument: '{}'", arg));
      }
    }
  } catch (std::runtime_error& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    config.has_error = true;
  }

  // The accept loop blocks one pool thread; timers need another
  if (!config.has_error && config.thread_count < 2) {
    fmt::print(stderr, "ERROR: at least 2 threads are required\n");
    config.has_error = true;
  }

  return config;
}

} // namespace weft::demo
