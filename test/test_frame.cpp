#include <catch2/catch.hpp>

#include <Checksum.hpp>
#include <Errors.hpp>
#include <Frame.hpp>
#include <utils.hpp>

TEST_CASE("checksums", "[checksum]") {
  SECTION("CRC-16/CCITT check value") {
    const std::string check = "123456789";
    const byte_vector data(check.begin(), check.end());
    REQUIRE(rt73::crc16_ccitt(data) == 0x29B1);
  }
  SECTION("sum8 makes the total sum zero") {
    const byte_vector data{0x02, 0x00, 0x00, 0x04, 0xFF};
    const auto sum = rt73::sum8(data);
    REQUIRE(static_cast<std::uint8_t>(0x02 + 0x04 + 0xFF + sum) == 0);
  }
  SECTION("names") {
    REQUIRE(rt73::string_to_checksum("sum8") == rt73::ChecksumKind::SUM8);
    REQUIRE(rt73::checksum_to_string(rt73::ChecksumKind::CRC16_CCITT) ==
            "crc16-ccitt");
    REQUIRE_THROWS_AS(rt73::string_to_checksum("md5"), rt73::Error);
  }
}

TEST_CASE("frame layout", "[frame]") {
  const rt73::Frame frame{0x10, 0x00001A00, {0x20, 0x00}};
  const auto bytes = rt73::encode_frame(frame, rt73::ChecksumKind::SUM8);
  REQUIRE(bytes.size() == rt73::frame_size(2, rt73::ChecksumKind::SUM8));
  REQUIRE(bytes == byte_vector{0x10, 0x00, 0x1A, 0x00, 0x00, 0x02, 0x00, 0x20,
                               0x00, 0xB4});
  REQUIRE(rt73::frame_payload_length(bytes) == 2);
  REQUIRE(rt73::decode_frame(bytes, rt73::ChecksumKind::SUM8) == frame);
}

TEST_CASE("frame length mismatch", "[frame]") {
  const rt73::Frame frame{0x11, 0x40, {1, 2, 3}};
  auto bytes = rt73::encode_frame(frame, rt73::ChecksumKind::CRC16_CCITT);
  bytes.push_back(0x00);
  REQUIRE_THROWS_AS(rt73::decode_frame(bytes, rt73::ChecksumKind::CRC16_CCITT),
                    rt73::ProtocolError);
  bytes.resize(4);
  REQUIRE_THROWS_AS(rt73::decode_frame(bytes, rt73::ChecksumKind::CRC16_CCITT),
                    rt73::ProtocolError);
}

TEST_CASE("every single bit corruption is detected", "[frame]") {
  const auto kind = GENERATE(rt73::ChecksumKind::SUM8,
                             rt73::ChecksumKind::CRC16_CCITT);
  const rt73::Frame frame{0x11, 0x00009A00, {'S', 'c', 'a', 'n', 0x00, 0xFF}};
  const auto bytes = rt73::encode_frame(frame, kind);
  REQUIRE(rt73::decode_frame(bytes, kind) == frame);

  for (std::size_t byte = 0; byte < bytes.size(); ++byte) {
    for (unsigned bit = 0; bit < 8; ++bit) {
      auto corrupted = bytes;
      corrupted[byte] ^= static_cast<std::uint8_t>(1u << bit);
      REQUIRE_THROWS_AS(rt73::decode_frame(corrupted, kind),
                        rt73::ProtocolError);
    }
  }
}
