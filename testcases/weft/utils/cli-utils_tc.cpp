
#include "stdinc.hpp"

#include "weft/utils/cli-utils.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

namespace weft::cli::tests {

namespace {
  struct Args {
    std::vector<std::string> args;
    std::vector<char*> argv_s;

    explicit Args(std::string_view line) : args{parse_cmd_args(line)} {
      for (auto& arg : args)
        argv_s.push_back(arg.data());
    }

    int argc() const { return int(args.size()); }
    char** argv() { return argv_s.data(); }
  };
} // namespace

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("cli-utils") {
    Args args{"exec-name 1 two three"};
    const int argc = args.argc();
    char** argv = args.argv();

    int i = 0;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 1);
    CATCH_REQUIRE(i == 1);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "two");
    CATCH_REQUIRE(i == 2);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "three");
    CATCH_REQUIRE(i == 3);
  }

  CATCH_SECTION("missing-or-malformed") {
    Args args{"exec-name --ticks 12x --threads"};
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(args.argc(), args.argv(), i), std::runtime_error);
    i = 3;
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(args.argc(), args.argv(), i), std::runtime_error);
  }

  CATCH_SECTION("quoting") {
    const auto args = parse_cmd_args(R"(demo --app-version "weft 1.0" 'a\tb')");
    CATCH_REQUIRE(args.size() == 4);
    CATCH_REQUIRE(args[2] == "weft 1.0");
    CATCH_REQUIRE(args[3] == "a\tb");
  }
}

} // namespace weft::cli::tests
