#include <catch2/catch.hpp>

#include <Errors.hpp>
#include <Framer.hpp>
#include <ISerialPort.hpp>
#include <utils.hpp>

#include "test_utils.hpp"

TEST_CASE("hello handshake", "[framer]") {
  auto objs = setup();
  const auto reply =
      objs.framer->send_command(objs.framer->profile().opcodes.hello, 0, {});
  REQUIRE(std::string(reply.begin(), reply.end()) == "RT73 MOCK");
  REQUIRE(objs.framer->stats().frames_sent == 1);
  REQUIRE(objs.framer->stats().retries == 0);
}

TEST_CASE("timeout on every attempt", "[framer]") {
  auto objs = setup();
  objs.radio().drop_responses(MockRadio::forever);
  const auto hello = objs.framer->profile().opcodes.hello;

  bool transport_error = false;
  try {
    objs.framer->send_command(hello, 0, {});
  } catch (const rt73::ProtocolError &) {
    FAIL("a timeout must not be reported as a protocol error");
  } catch (const rt73::TransportError &) {
    transport_error = true;
  }
  REQUIRE(transport_error);
  REQUIRE(objs.radio().count_requests(hello) == 3);
  REQUIRE(objs.framer->stats().frames_sent == 3);
  REQUIRE(objs.framer->stats().timeouts == 3);
}

TEST_CASE("attempts follow the profile", "[framer]") {
  rt73::ProtocolProfile profile{};
  profile.attempts = 5;
  auto objs = setup(profile);
  objs.radio().drop_responses(MockRadio::forever);
  REQUIRE_THROWS_AS(objs.framer->read_region(0, 16), rt73::TransportError);
  REQUIRE(objs.radio().count_requests(profile.opcodes.read) == 5);
}

TEST_CASE("corrupted checksum is retried once", "[framer]") {
  auto objs = setup();
  objs.radio()[0x20] = 0xAB;
  objs.radio().corrupt_responses(1);
  const auto data = objs.framer->read_region(0x20, 1);
  REQUIRE(data == byte_vector{0xAB});
  REQUIRE(objs.framer->stats().retries == 1);
  REQUIRE(objs.framer->stats().corrupt_responses == 1);
  REQUIRE(objs.radio().count_requests(objs.framer->profile().opcodes.read) ==
          2);
}

TEST_CASE("persistent corruption is a protocol error", "[framer]") {
  auto objs = setup();
  objs.radio().corrupt_responses(MockRadio::forever);
  REQUIRE_THROWS_AS(
      objs.framer->send_command(objs.framer->profile().opcodes.hello, 0, {}),
      rt73::ProtocolError);
  REQUIRE(objs.framer->stats().frames_sent == 3);
}

TEST_CASE("device rejection is not retried", "[framer]") {
  auto objs = setup();
  try {
    objs.framer->send_command(0x55, 0x100, {});
    FAIL("expected a device error");
  } catch (const rt73::DeviceError &e) {
    REQUIRE(e.code == MockRadio::NAK_UNKNOWN_OPCODE);
  }
  REQUIRE(objs.radio().count_requests(0x55) == 1);
  REQUIRE(objs.framer->stats().retries == 0);
}

TEST_CASE("regions are split by the maximum payload", "[framer]") {
  rt73::ProtocolProfile profile{};
  profile.max_payload = 100;
  auto objs = setup(profile);

  SECTION("read") {
    for (std::uint32_t i = 0; i < 250; ++i) {
      objs.radio()[0x1000 + i] = static_cast<std::uint8_t>(i);
    }
    const auto data = objs.framer->read_region(0x1000, 250);
    REQUIRE(data.size() == 250);
    REQUIRE(data[249] == 249);
    REQUIRE(objs.radio().count_requests(profile.opcodes.read) == 3);
  }
  SECTION("record atomic write") {
    const byte_vector data(200, 0x5A);
    objs.framer->write_region(0x2000, data, 16);
    const auto &requests = objs.radio().requests();
    REQUIRE(requests.size() == 3);
    REQUIRE(requests[0].address == 0x2000);
    REQUIRE(requests[0].payload.size() == 96);
    REQUIRE(requests[1].address == 0x2000 + 96);
    REQUIRE(requests[1].payload.size() == 96);
    REQUIRE(requests[2].payload.size() == 8);
    REQUIRE(objs.radio().read(0x2000, 200) == data);
  }
  SECTION("unaligned write when records may be split") {
    profile.record_atomic_writes = false;
    auto split = setup(profile);
    split.framer->write_region(0x2000, byte_vector(200, 0x5A), 16);
    REQUIRE(split.radio().requests().size() == 2);
  }
  SECTION("record larger than a frame") {
    REQUIRE_THROWS_AS(
        objs.framer->write_region(0x2000, byte_vector(256, 0), 128),
        rt73::LayoutError);
  }
}

TEST_CASE("cancellation between frames", "[framer]") {
  auto objs = setup();
  const auto hello = objs.framer->profile().opcodes.hello;
  ISerialPort::request_stop();
  REQUIRE_THROWS_AS(objs.framer->send_command(hello, 0, {}),
                    ISerialPort::Interrupted);
  REQUIRE(objs.radio().count_requests(hello) == 0);
  // the stop request is consumed
  REQUIRE_NOTHROW(objs.framer->send_command(hello, 0, {}));
}
