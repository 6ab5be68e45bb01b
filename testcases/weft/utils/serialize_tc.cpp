
#include "stdinc.hpp"

#include "weft/rpc/wire-codec.hpp"
#include "weft/utils/serialize.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <sstream>
#include <variant>

namespace weft::tests {

CATCH_TEST_CASE("Serialize", "[serialize]") {
  CATCH_SECTION("integers are little-endian") {
    std::stringstream ss;
    CATCH_REQUIRE(!write_u32(ss, 0x01020304u));
    const auto bytes = ss.str();
    CATCH_REQUIRE(bytes.size() == 4);
    CATCH_REQUIRE(bytes[0] == 0x04);
    CATCH_REQUIRE(bytes[3] == 0x01);
  }

  CATCH_SECTION("integers") {
    std::stringstream ss;
    CATCH_REQUIRE(!write(ss, true));
    CATCH_REQUIRE(!write(ss, std::numeric_limits<int64_t>::lowest()));
    CATCH_REQUIRE(!write(ss, uint16_t(65535)));
    CATCH_REQUIRE(!write(ss, int8_t(-3)));

    bool b = false;
    int64_t i64 = 0;
    uint16_t u16 = 0;
    int8_t i8 = 0;
    CATCH_REQUIRE(!read(ss, b));
    CATCH_REQUIRE(!read(ss, i64));
    CATCH_REQUIRE(!read(ss, u16));
    CATCH_REQUIRE(!read(ss, i8));
    CATCH_REQUIRE(b);
    CATCH_REQUIRE(i64 == std::numeric_limits<int64_t>::lowest());
    CATCH_REQUIRE(u16 == 65535);
    CATCH_REQUIRE(i8 == -3);
  }

  CATCH_SECTION("strings") {
    std::stringstream ss;
    CATCH_REQUIRE(!write(ss, std::string_view{"hello"}));
    CATCH_REQUIRE(!write(ss, std::string_view{}));
    std::string a, b{"not empty"};
    CATCH_REQUIRE(!read(ss, a));
    CATCH_REQUIRE(!read(ss, b));
    CATCH_REQUIRE(a == "hello");
    CATCH_REQUIRE(b.empty());
  }

  CATCH_SECTION("truncated input") {
    std::stringstream ss;
    CATCH_REQUIRE(!write(ss, std::string_view{"truncated"}));
    const auto bytes = ss.str();
    std::istringstream in{bytes.substr(0, bytes.size() - 2)};
    std::string x;
    CATCH_REQUIRE(read(in, x) == make_error_code(ecode::premature_eof));
  }

  CATCH_SECTION("oversized string length") {
    std::stringstream ss;
    CATCH_REQUIRE(!write_u32(ss, uint32_t(k_max_string_size + 1)));
    std::string x;
    CATCH_REQUIRE(read(ss, x) == make_error_code(ecode::object_too_large));
  }

  CATCH_SECTION("variants") {
    using V = std::variant<int32_t, std::string>;
    std::stringstream ss;
    CATCH_REQUIRE(!write(ss, V{std::string{"abc"}}));
    CATCH_REQUIRE(!write(ss, V{int32_t(-7)}));

    V x;
    CATCH_REQUIRE(!read(ss, x));
    CATCH_REQUIRE(std::get<std::string>(x) == "abc");
    CATCH_REQUIRE(!read(ss, x));
    CATCH_REQUIRE(std::get<int32_t>(x) == -7);
  }

  CATCH_SECTION("variant with a bad index") {
    std::stringstream ss;
    CATCH_REQUIRE(!write_u32(ss, 2));
    std::variant<int32_t, std::string> x;
    CATCH_REQUIRE(read(ss, x) == make_error_code(ecode::invalid_data));
  }

  CATCH_SECTION("frames") {
    using V = std::variant<int32_t, std::string>;
    const auto frame = rpc::wire::encode_frame(V{std::string{"frame"}});
    CATCH_REQUIRE(frame.has_value());

    const auto decoded = rpc::wire::decode_frame<V>(*frame);
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(std::get<std::string>(*decoded) == "frame");

    const auto serialization_error = make_error_code(ecode::serialization_error);
    CATCH_REQUIRE(rpc::wire::decode_frame<V>(*frame + "x").error() == serialization_error);
    CATCH_REQUIRE(rpc::wire::decode_frame<V>(frame->substr(0, 6)).error() == serialization_error);
    CATCH_REQUIRE(rpc::wire::decode_frame<V>("").error() == serialization_error);
  }
}

} // namespace weft::tests
