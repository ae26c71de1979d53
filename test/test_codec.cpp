#include <catch2/catch.hpp>

#include <Codec.hpp>
#include <Errors.hpp>
#include <RT73.hpp>

#include "test_utils.hpp"

#include <array>
#include <limits>

using namespace Layout;

namespace {

constexpr std::array<FieldSpec, 1> two_bit_flag{{
    {"flag"sv, BitFlag{.offset = 0, .mask = 0x03}},
}};

constexpr std::uint32_t channel0 = 0x20000;
constexpr std::uint32_t contact0 = 0x1B400;
constexpr std::uint32_t zone0 = 0x1F800;

auto sample_image() {
  return rt73::Codec{rt73map::codeplug_map()}.encode(sample_records());
}

} // namespace

TEST_CASE("codeplug round trip", "[codec]") {
  const rt73::Codec codec{rt73map::codeplug_map()};
  const auto sample = sample_records();

  SECTION("records survive encode and decode") {
    const auto image = codec.encode(sample);
    REQUIRE(image.size() == rt73map::codeplug_size);
    REQUIRE(codec.decode(image) == sample);
  }
  SECTION("an image survives decode and encode") {
    auto image = sample_image();
    // bytes outside every field of channel 0
    image[channel0 + 0x16] = 0x42;
    image[channel0 + 0x15] &= ~0x20;
    REQUIRE(codec.encode(codec.decode(image)) == image);
  }
  SECTION("blank image decodes to empty regions") {
    const byte_vector blank(rt73map::codeplug_size, 0x00);
    const auto set = codec.decode(blank);
    REQUIRE(set.regions.size() == 17);
    for (const auto &r : set.regions) {
      REQUIRE(r.records.empty());
    }
    REQUIRE(codec.encode(set) == blank);
  }
}

TEST_CASE("decoded channel", "[codec]") {
  const rt73::Codec codec{rt73map::codeplug_map()};
  const auto image = sample_image();
  REQUIRE(image[channel0 + 0x02] == 'L');
  REQUIRE(image[channel0 + 0x07] == 0x00);
  // CTCSS transmit, DCS receive
  REQUIRE(image[channel0 + 0x1A] == (0x04 | 0x02));
  // 1-based reference to contact slot 1
  REQUIRE(image[channel0 + 0x1E] == 2);

  const auto set = codec.decode(image);
  const auto &channel = set.at("channels").records.at(0);
  REQUIRE(std::get<std::string>(channel.at("name")) == "Local");
  REQUIRE(std::get<std::int64_t>(channel.at("rx_freq_hz")) == 446006250);
  REQUIRE(std::get<std::string>(channel.at("tx_tone")) == "67.0");
  REQUIRE(std::get<std::string>(channel.at("rx_tone")) == "D023N");
  REQUIRE(std::holds_alternative<std::monostate>(channel.at("scan_list")));
  REQUIRE(channel.reserved.empty());

  // zone references count 32 byte records from the zone table start
  REQUIRE(image[zone0 + 0x0D] == 65);
  REQUIRE(image[zone0 + 0x0E] == 0);

  const auto &group = set.at("rx_groups").records.at(0);
  REQUIRE(std::get<rt73::SlotList>(group.at("contacts")) ==
          rt73::SlotList{0u, std::nullopt, 1u});
}

TEST_CASE("reserved bytes are kept", "[codec]") {
  const rt73::Codec codec{rt73map::codeplug_map()};
  auto image = sample_image();
  image[channel0 + 0x16] = 0x42;

  auto set = codec.decode(image);
  const auto &channel = set.at("channels").records.at(0);
  REQUIRE(channel.reserved.size() == 32);
  REQUIRE(channel.reserved[0x16] == 0x42);
  // owned bits never show up as reserved
  REQUIRE(channel.reserved[0x02] == 0x00);

  SECTION("reserved bits overlapping a field are rejected") {
    set.at("channels").records.at(0).reserved[0x02] = 0x01;
    REQUIRE_THROWS_AS(codec.encode(set), rt73::EncodeError);
  }
}

TEST_CASE("decode errors", "[codec]") {
  const rt73::Codec codec{rt73map::codeplug_map()};
  auto image = sample_image();

  SECTION("image size") {
    REQUIRE_THROWS_AS(codec.decode(byte_vector(100)), rt73::DecodeError);
  }
  SECTION("unknown choice value") {
    image[contact0 + 0x02] = 0x77;
    try {
      codec.decode(image);
      FAIL("expected a decode error");
    } catch (const rt73::DecodeError &e) {
      REQUIRE(e.region == "contacts");
      REQUIRE(e.offset == contact0 + 0x02);
    }
  }
  SECTION("tone index out of range") {
    image[channel0 + 0x1B] = 200;
    REQUIRE_THROWS_AS(codec.decode(image), rt73::DecodeError);
  }
  SECTION("reference beyond the target region") {
    // rx_groups has 250 slots
    image[channel0 + 0x17] = 0xFB;
    try {
      codec.decode(image);
      FAIL("expected a decode error");
    } catch (const rt73::DecodeError &e) {
      REQUIRE(e.region == "channels");
      REQUIRE(e.offset == channel0 + 0x17);
    }
  }
  SECTION("zone reference into the zone table") {
    image[zone0 + 0x0D] = 64;
    try {
      codec.decode(image);
      FAIL("expected a decode error");
    } catch (const rt73::DecodeError &e) {
      REQUIRE(e.region == "zones");
      REQUIRE(e.offset == zone0 + 0x0D);
    }
  }
  SECTION("partially set flag") {
    const rt73::Codec small{
        MemoryMap{"m", 0, 4, {RegionDescriptor{"r", 0, 4, 4, two_bit_flag}}}};
    REQUIRE(std::get<bool>(small.decode(byte_vector{0x03, 0, 0, 0})
                               .at("r")
                               .records.at(0)
                               .at("flag")));
    REQUIRE_THROWS_AS(small.decode(byte_vector{0x01, 0, 0, 0}),
                      rt73::DecodeError);
  }
}

TEST_CASE("encode errors", "[codec]") {
  const rt73::Codec codec{rt73map::codeplug_map()};
  auto set = sample_records();
  auto &channel = set.at("channels").records.at(0);

  const auto expect_field_error = [&codec, &set](std::string_view field) {
    try {
      codec.encode(set);
      FAIL("expected an encode error");
    } catch (const rt73::EncodeError &e) {
      REQUIRE(e.region == "channels");
      REQUIRE(e.slot == 0u);
      REQUIRE(e.field == field);
    }
  };

  SECTION("missing field") {
    channel.fields.erase("name");
    expect_field_error("name");
  }
  SECTION("unknown field") {
    channel.fields.emplace("volume", std::int64_t{3});
    expect_field_error("volume");
  }
  SECTION("wrong type") {
    channel.at("name") = std::int64_t{7};
    expect_field_error("name");
  }
  SECTION("text too long") {
    channel.at("name") = "A much too long name"s;
    expect_field_error("name");
  }
  SECTION("value out of range") {
    channel.at("rx_color_code") = std::int64_t{16};
    expect_field_error("rx_color_code");
  }
  SECTION("frequency off the step") {
    channel.at("rx_freq_hz") = std::int64_t{446006255};
    expect_field_error("rx_freq_hz");
  }
  SECTION("unknown label") {
    channel.at("power") = "MEDIUM"s;
    expect_field_error("power");
  }
  SECTION("invalid tone") {
    channel.at("tx_tone") = "68.0"s;
    expect_field_error("tx_tone");
  }
  SECTION("reference to a missing slot") {
    channel.at("default_contact") = std::int64_t{1024};
    expect_field_error("default_contact");
  }
  SECTION("duplicate slot") {
    set.at("channels").records.push_back(channel_record(0, "Twin"));
    REQUIRE_THROWS_AS(codec.encode(set), rt73::EncodeError);
  }
  SECTION("slot out of range") {
    set.at("channels").records.push_back(channel_record(1024, "Far"));
    REQUIRE_THROWS_AS(codec.encode(set), rt73::EncodeError);
  }
  SECTION("unknown region") {
    set.regions.push_back({"bogus", {}});
    REQUIRE_THROWS_AS(codec.encode(set), rt73::EncodeError);
  }
}

TEST_CASE("integer bounds", "[codec]") {
  const rt73::Codec codec{rt73map::codeplug_map()};
  auto set = sample_records();
  auto &channel = set.at("channels").records.at(0);

  const auto rejects = [&](std::string_view field, std::int64_t value) {
    const auto kept = channel.at(field);
    channel.at(field) = value;
    try {
      codec.encode(set);
      FAIL("expected an encode error");
    } catch (const rt73::EncodeError &e) {
      REQUIRE(e.field == field);
    }
    channel.at(field) = kept;
  };

  SECTION("extreme values") {
    rejects("rx_freq_hz", std::numeric_limits<std::int64_t>::min());
    rejects("rx_freq_hz", std::numeric_limits<std::int64_t>::max());
    rejects("id", std::numeric_limits<std::int64_t>::min());
  }
  SECTION("largest representable frequency") {
    channel.at("rx_freq_hz") = std::int64_t{0xFFFFFFFF} * 10;
    const auto image = codec.encode(set);
    REQUIRE(image[channel0 + 0x0C] == 0xFF);
    REQUIRE(image[channel0 + 0x0F] == 0xFF);
    rejects("rx_freq_hz", std::int64_t{0xFFFFFFFF} * 10 + 10);
  }
  SECTION("negative scale") {
    auto &dmr = set.at("dmr_settings").records;
    const byte_vector zeros(rt73map::codeplug_size, 0x00);
    auto image = zeros;
    image[0x134F] = 1;
    dmr = codec.decode(image).at("dmr_settings").records;
    dmr.at(0).at("rssi_threshold_dbm") = std::int64_t{-345};
    const auto out = codec.encode(set);
    REQUIRE(out[0x12D8 + 0x9E] == 255);
    dmr.at(0).at("rssi_threshold_dbm") = std::int64_t{-89};
    REQUIRE_THROWS_AS(codec.encode(set), rt73::EncodeError);
  }
}

TEST_CASE("split mask bits", "[codec]") {
  constexpr std::array<FieldSpec, 1> split{{
      {"tone"sv, ScaledInt{.offset = 0, .mask = 0x05}},
  }};
  const rt73::Codec small{
      MemoryMap{"m", 0, 1, {RegionDescriptor{"r", 0, 1, 1, split}}}};
  rt73::RecordSet set;
  set.regions = {{"r", {{0, {{"tone", std::int64_t{5}}}, {}}}}};
  REQUIRE(small.encode(set) == byte_vector{0x05});
  set.regions[0].records[0].at("tone") = std::int64_t{2};
  REQUIRE_THROWS_AS(small.encode(set), rt73::EncodeError);
}
