
#include "stdinc.hpp"

#include "weft/demo/config.hpp"
#include "weft/utils/cli-utils.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace weft::demo::tests {

namespace {
  Config parse(std::string_view line) {
    auto args = cli::parse_cmd_args(line);
    std::vector<char*> argv;
    for (auto& arg : args)
      argv.push_back(arg.data());
    return parse_command_line(int(argv.size()), argv.data());
  }
} // namespace

CATCH_TEST_CASE("Config", "[demo][config]") {
  CATCH_SECTION("defaults") {
    const auto config = parse("weft-demo");
    CATCH_REQUIRE(!config.has_error);
    CATCH_REQUIRE(!config.show_help);
    CATCH_REQUIRE(config.transport == TransportKind::MEM);
    CATCH_REQUIRE(config.tick_millis == 100);
    CATCH_REQUIRE(config.thread_count == 8);
    CATCH_REQUIRE(config.channel_capacity == 32);
  }

  CATCH_SECTION("every switch") {
    const auto config = parse("weft-demo --app-version 'demo 2.0' --tick-ms 20 --threads 4 "
                              "--capacity 2 --transport wire --ticks 9");
    CATCH_REQUIRE(!config.has_error);
    CATCH_REQUIRE(config.app_version == "demo 2.0");
    CATCH_REQUIRE(config.tick_millis == 20);
    CATCH_REQUIRE(config.thread_count == 4);
    CATCH_REQUIRE(config.channel_capacity == 2);
    CATCH_REQUIRE(config.transport == TransportKind::WIRE);
    CATCH_REQUIRE(config.tick_count == 9);
    CATCH_REQUIRE(str(config.transport) == "wire");
  }

  CATCH_SECTION("help wins over everything else") {
    const auto config = parse("weft-demo --bogus -h");
    CATCH_REQUIRE(config.show_help);
    CATCH_REQUIRE(!config.has_error);
  }

  CATCH_SECTION("errors") {
    CATCH_REQUIRE(parse("weft-demo --bogus").has_error);
    CATCH_REQUIRE(parse("weft-demo --transport carrier-pigeon").has_error);
    CATCH_REQUIRE(parse("weft-demo --tick-ms").has_error);
    CATCH_REQUIRE(parse("weft-demo --tick-ms fast").has_error);
    CATCH_REQUIRE(parse("weft-demo --capacity 0").has_error);
    CATCH_REQUIRE(parse("weft-demo --ticks -1").has_error);
    CATCH_REQUIRE(parse("weft-demo --threads 1").has_error);
    CATCH_REQUIRE(!parse("weft-demo --threads 2").has_error);
  }
}

} // namespace weft::demo::tests
