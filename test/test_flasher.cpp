#include <catch2/catch.hpp>

#include <Checksum.hpp>
#include <Errors.hpp>
#include <FirmwareFlasher.hpp>
#include <FirmwareImage.hpp>

#include "test_utils.hpp"

#include <numeric>

namespace {

constexpr std::uint16_t chunk_size = 256;

rt73::ProtocolProfile flash_profile() {
  rt73::ProtocolProfile profile{};
  profile.max_payload = chunk_size;
  return profile;
}

byte_vector firmware_bytes(std::size_t size) {
  byte_vector data(size);
  std::iota(data.begin(), data.end(), std::uint8_t{1});
  return data;
}

} // namespace

TEST_CASE("firmware image chunks", "[flasher]") {
  const rt73::FirmwareImage image{firmware_bytes(2500), chunk_size};
  REQUIRE(image.size() == 2500);
  REQUIRE(image.chunk_count() == 10);
  REQUIRE(image.chunk_address(3) == 3 * chunk_size);
  REQUIRE(image.chunk(0)[0] == 1);

  const auto last = image.chunk(9);
  REQUIRE(last.size() == chunk_size);
  // 2500 - 9 * 256 = 196 bytes of data, then padding
  REQUIRE(last[195] != 0x00);
  REQUIRE(last[196] == 0x00);
  REQUIRE(last[255] == 0x00);
  REQUIRE(image.chunk_checksum(rt73::ChecksumKind::CRC16_CCITT, 9) ==
          rt73::crc16_ccitt(last));

  REQUIRE_THROWS_AS(image.chunk(10), rt73::FlashError);
  REQUIRE_THROWS_AS((rt73::FirmwareImage{byte_vector{}, chunk_size}),
                    rt73::FlashError);
  REQUIRE_THROWS_AS((rt73::FirmwareImage{firmware_bytes(10), 0}),
                    rt73::FlashError);
}

TEST_CASE("successful flash", "[flasher]") {
  auto objs = setup(flash_profile());
  const auto data = firmware_bytes(2500);
  const rt73::FirmwareImage image{data, chunk_size};

  rt73::FirmwareFlasher flasher{*objs.framer};
  REQUIRE(flasher.state() == rt73::FlashState::IDLE);
  flasher.flash(image);
  REQUIRE(flasher.state() == rt73::FlashState::IDLE);

  auto &radio = objs.radio();
  REQUIRE(radio.programmed_chunks() ==
          std::vector<std::size_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
  REQUIRE(radio.resets() == 1);
  REQUIRE(byte_vector(radio.firmware().begin(),
                      radio.firmware().begin() + 2500) == data);

  // erase, then every program before any verify, then reset
  const auto &ops = objs.framer->profile().opcodes;
  const auto &requests = radio.requests();
  REQUIRE(requests.size() == 1 + 10 + 10 + 1);
  REQUIRE(requests.front().opcode == ops.erase);
  for (std::size_t i = 0; i < 10; ++i) {
    REQUIRE(requests[1 + i].opcode == ops.program);
    REQUIRE(requests[1 + i].address == i * chunk_size);
    REQUIRE(requests[11 + i].opcode == ops.verify);
  }
  REQUIRE(requests.back().opcode == ops.reset);
}

TEST_CASE("programming failure", "[flasher]") {
  auto objs = setup(flash_profile());
  objs.radio().fail_program_at(5);
  rt73::FirmwareFlasher flasher{*objs.framer};
  try {
    flasher.flash(rt73::FirmwareImage{firmware_bytes(2500), chunk_size});
    FAIL("expected a flash error");
  } catch (const rt73::FlashError &e) {
    REQUIRE(e.state == rt73::FlashState::PROGRAMMING);
    REQUIRE(e.chunk_index == 5u);
  }
  REQUIRE(objs.radio().programmed_chunks() ==
          std::vector<std::size_t>{0, 1, 2, 3, 4, 5});
  REQUIRE(objs.radio().count_requests(objs.framer->profile().opcodes.verify) ==
          0);
  REQUIRE(objs.radio().resets() == 0);
  REQUIRE(flasher.state() == rt73::FlashState::IDLE);
}

TEST_CASE("erase timeout", "[flasher]") {
  auto objs = setup(flash_profile());
  objs.radio().drop_responses(MockRadio::forever);
  rt73::FirmwareFlasher flasher{*objs.framer};
  try {
    flasher.flash(rt73::FirmwareImage{firmware_bytes(600), chunk_size});
    FAIL("expected a flash error");
  } catch (const rt73::FlashError &e) {
    REQUIRE(e.state == rt73::FlashState::ERASING);
    REQUIRE_FALSE(e.chunk_index);
  }
  REQUIRE(objs.radio().programmed_chunks().empty());
  REQUIRE(flasher.state() == rt73::FlashState::IDLE);
}

TEST_CASE("chunks larger than a frame", "[flasher]") {
  auto objs = setup(flash_profile());
  rt73::FirmwareFlasher flasher{*objs.framer};
  REQUIRE_THROWS_AS(
      flasher.flash(rt73::FirmwareImage{firmware_bytes(600), 2 * chunk_size}),
      rt73::FlashError);
  REQUIRE(objs.radio().requests().empty());
}
