#include <catch2/catch.hpp>

#include <Errors.hpp>
#include <Protocol.hpp>

#include <sstream>

TEST_CASE("default profile", "[profile]") {
  const rt73::ProtocolProfile profile{};
  REQUIRE(profile.attempts == 3);
  REQUIRE(profile.checksum == rt73::ChecksumKind::CRC16_CCITT);
  REQUIRE(profile.opcodes.ack(profile.opcodes.read) == 0x90);
}

TEST_CASE("load profile", "[profile]") {
  SECTION("missing keys keep their defaults") {
    std::istringstream is{R"({
      "version": "rt73-test",
      "checksum": "sum8",
      "max_payload": 512,
      "timeout_ms": 250,
      "opcodes": {"read": 82}
    })"};
    const auto profile = rt73::load_profile(is);
    REQUIRE(profile.version == "rt73-test");
    REQUIRE(profile.checksum == rt73::ChecksumKind::SUM8);
    REQUIRE(profile.max_payload == 512);
    REQUIRE(profile.timeout == std::chrono::milliseconds{250});
    REQUIRE(profile.opcodes.read == 82);
    REQUIRE(profile.opcodes.write == rt73::Opcodes{}.write);
    REQUIRE(profile.attempts == 3);
    REQUIRE(profile.readback_verify);
  }
  SECTION("dump and load") {
    rt73::ProtocolProfile profile{};
    profile.attempts = 7;
    profile.readback_verify = false;
    profile.baud = 57600;
    std::istringstream is{rt73::dump_profile(profile)};
    const auto loaded = rt73::load_profile(is);
    REQUIRE(loaded.attempts == 7);
    REQUIRE_FALSE(loaded.readback_verify);
    REQUIRE(loaded.baud == 57600);
    REQUIRE(rt73::dump_profile(loaded) == rt73::dump_profile(profile));
  }
}

TEST_CASE("invalid profiles", "[profile]") {
  const auto load = [](const char *text) {
    std::istringstream is{text};
    return rt73::load_profile(is);
  };
  REQUIRE_THROWS_AS(load("not json"), rt73::Error);
  REQUIRE_THROWS_AS(load("[1, 2]"), rt73::Error);
  REQUIRE_THROWS_AS(load(R"({"attempts": 0})"), rt73::Error);
  REQUIRE_THROWS_AS(load(R"({"max_payload": 70000})"), rt73::Error);
  REQUIRE_THROWS_AS(load(R"({"readback_verify": 1})"), rt73::Error);
  REQUIRE_THROWS_AS(load(R"({"checksum": "md5"})"), rt73::Error);
  REQUIRE_THROWS_AS(load(R"({"opcodes": {"read": 256}})"), rt73::Error);
  REQUIRE_THROWS_AS(load(R"({"opcodes": {"ack_flag": 0}})"), rt73::Error);
}
