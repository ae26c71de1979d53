#include <catch2/catch.hpp>

#include <BulkTable.hpp>
#include <DeviceSession.hpp>
#include <Errors.hpp>
#include <RT73.hpp>

#include "test_utils.hpp"

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>

#include <sstream>

namespace {

std::vector<rt73::BulkEntry> make_contacts(std::uint32_t count) {
  std::vector<rt73::BulkEntry> res;
  res.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    res.push_back({1000000 + i, fmt::format("K{:06},OP", i)});
  }
  return res;
}

constexpr std::string_view contacts_csv =
    "\xEF\xBB\xBFRADIO_ID,CALLSIGN,FIRST_NAME,LAST_NAME,CITY,STATE,COUNTRY\r\n"
    "1023001,VE3ABC,\"Smith, John\",,Toronto,ON,Canada\r\n"
    "\r\n"
    "2621234,DL1XYZ,Hans,Meier,Berlin,Berlin,Germany\r\n";

} // namespace

TEST_CASE("bulk table encoding", "[bulk]") {
  const rt73::BulkTable table{rt73map::contact_db_map()};
  REQUIRE(table.record_size() == 16);
  REQUIRE(table.capacity() == 300000);
  REQUIRE(table.text_capacity() == 13);

  const std::vector<rt73::BulkEntry> entries{{3120001, "W1AW"},
                                             {2345678, "G0ABC,Bob"}};
  const auto bytes = table.encode(entries);
  REQUIRE(bytes.size() == 16 + 2 * 16);
  // count and record size, zero padded
  REQUIRE(byte_vector(bytes.begin(), bytes.begin() + 16) ==
          byte_vector{2, 0, 0, 0, 16, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0});
  // 24 bit id followed by NUL padded text
  REQUIRE(byte_vector(bytes.begin() + 16, bytes.begin() + 32) ==
          byte_vector{0x81, 0x9B, 0x2F, 'W', '1', 'A', 'W', 0, 0, 0, 0, 0, 0,
                      0, 0, 0});
  REQUIRE(table.decode(bytes) == entries);

  SECTION("empty table") {
    const auto empty = table.encode({});
    REQUIRE(empty.size() == 16);
    REQUIRE(table.decode(empty).empty());
  }
  SECTION("ids outside 24 bits") {
    const std::vector<rt73::BulkEntry> bad{{0x1000000, "X"}};
    REQUIRE_THROWS_AS(table.encode(bad), rt73::EncodeError);
    const std::vector<rt73::BulkEntry> zero{{0, "X"}};
    REQUIRE_THROWS_AS(table.encode(zero), rt73::EncodeError);
  }
  SECTION("text longer than the record") {
    const std::vector<rt73::BulkEntry> bad{{1, "ABCDEFGHIJKLMN"}};
    REQUIRE_THROWS_AS(table.encode(bad), rt73::EncodeError);
  }
  SECTION("record size mismatch") {
    const rt73::BulkTable wide{rt73map::contact_db_map(128)};
    REQUIRE_THROWS_AS(wide.decode(bytes), rt73::DecodeError);
  }
  SECTION("truncated table") {
    REQUIRE_THROWS_AS(table.decode(std::span{bytes}.first(20)),
                      rt73::DecodeError);
  }
}

TEST_CASE("bulk upload of 200000 contacts", "[bulk][slow]") {
  auto objs = setup();
  CountingLink link{*objs.framer};
  const auto map = rt73map::contact_db_map();
  const rt73::BulkTable table{map};
  const auto entries = make_contacts(200000);
  const auto bytes = table.encode(entries);
  REQUIRE(bytes.size() == 16 + 200000 * 16);

  rt73::DeviceSession session{map, link};
  auto guard = session.connect();
  session.upload_table(map, bytes);

  // an empty header, the used entries in region sized chunks, the header
  const std::size_t chunk = 1u << 20;
  REQUIRE(link.writes ==
          std::vector<std::size_t>{16, chunk, chunk, chunk,
                                   200000 * 16 - 3 * chunk, 16});
  REQUIRE(link.reads == link.writes.size());
  const auto &requests = objs.radio().requests();
  const auto first_write =
      rg::find_if(requests, [&objs](const rt73::Frame &f) {
        return f.opcode == objs.framer->profile().opcodes.write;
      });
  REQUIRE(first_write != requests.end());
  REQUIRE(first_write->address == rt73map::contact_db_base);

  link.reads = 0;
  const auto downloaded = session.download_table(map);
  REQUIRE(link.reads == 2);
  REQUIRE(downloaded == bytes);
  REQUIRE(table.decode(downloaded) == entries);
}

TEST_CASE("interrupted bulk upload leaves an empty table", "[bulk]") {
  auto objs = setup();
  const auto map = rt73map::group_db_map();
  const rt73::BulkTable table{map};
  const std::vector<rt73::BulkEntry> old_entries{{91, "Worldwide"}};
  objs.radio().write(rt73map::group_db_base, table.encode(old_entries));

  // fails once the entries are being written
  struct FailingLink : CountingLink {
    using CountingLink::CountingLink;
    void write_region(std::uint32_t address,
                      std::span<const std::uint8_t> data,
                      std::uint32_t align = 1) override {
      if (writes.size() == 1) {
        throw rt73::TransportError("link lost");
      }
      CountingLink::write_region(address, data, align);
    }
  } link{*objs.framer};

  rt73::DeviceSession session{map, link};
  auto guard = session.connect();
  const auto bytes = table.encode(make_contacts(3));
  REQUIRE_THROWS_AS(session.upload_table(map, bytes), rt73::TransportError);
  REQUIRE(session.state() == rt73::SessionState::DISCONNECTED);
  REQUIRE(link.writes == std::vector<std::size_t>{16});

  const auto header = objs.radio().read(rt73map::group_db_base, 16);
  REQUIRE(header == byte_vector{0, 0, 0, 0, 16, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
                                0});
  auto again = session.connect();
  REQUIRE(table.decode(session.download_table(map)).empty());
}

TEST_CASE("bulk table upload limits", "[bulk]") {
  auto objs = setup();
  const auto map = rt73map::group_db_map();
  rt73::DeviceSession session{map, *objs.framer};
  auto guard = session.connect();
  REQUIRE_THROWS_AS(session.upload_table(map, byte_vector(20)),
                    rt73::EncodeError);
  REQUIRE_THROWS_AS(session.upload_table(map, byte_vector(8)),
                    rt73::EncodeError);

  SECTION("count beyond the capacity") {
    byte_vector header(16);
    store_le(std::span{header}.first(4), std::uint32_t{40000});
    header[4] = 16;
    objs.radio().write(rt73map::group_db_base, header);
    REQUIRE_THROWS_AS(session.download_table(map), rt73::DecodeError);
  }
}

TEST_CASE("csv lines", "[bulk][csv]") {
  REQUIRE(rt73::split_csv_line("a,b,,c") ==
          std::vector<std::string>{"a", "b", "", "c"});
  REQUIRE(rt73::split_csv_line(R"("x, y","say ""hi""",z)") ==
          std::vector<std::string>{"x, y", R"(say "hi")", "z"});
  REQUIRE(rt73::split_csv_line("last\r") == std::vector<std::string>{"last"});
}

TEST_CASE("contact csv import", "[bulk][csv]") {
  SECTION("long records") {
    std::istringstream is{std::string{contacts_csv}};
    const auto entries = rt73::read_contacts_csv(is, 125);
    REQUIRE(entries ==
            std::vector<rt73::BulkEntry>{
                {1023001, "VE3ABC,Smith, John,Toronto,ON,Canada"},
                {2621234, "DL1XYZ,Hans Meier,Berlin,Berlin,Germany"}});
  }
  SECTION("short records truncate the text") {
    std::istringstream is{std::string{contacts_csv}};
    const auto entries = rt73::read_contacts_csv(is, 13);
    REQUIRE(entries.at(0).text == "VE3ABC,Smith,");
    REQUIRE(entries.at(1).text == "DL1XYZ,Hans M");
  }
  SECTION("missing column") {
    std::istringstream is{"RADIO_ID,CALLSIGN\n1,A\n"};
    REQUIRE_THROWS_AS(rt73::read_contacts_csv(is, 13), rt73::EncodeError);
  }
  SECTION("invalid id") {
    std::istringstream is{
        "RADIO_ID,CALLSIGN,FIRST_NAME,LAST_NAME,CITY,STATE,COUNTRY\n"
        "12ab,A,B,C,D,E,F\n"};
    try {
      rt73::read_contacts_csv(is, 13);
      FAIL("expected an encode error");
    } catch (const rt73::EncodeError &e) {
      REQUIRE(e.field == "RADIO_ID");
    }
  }
  SECTION("short row") {
    std::istringstream is{
        "RADIO_ID,CALLSIGN,FIRST_NAME,LAST_NAME,CITY,STATE,COUNTRY\n"
        "1,A,B\n"};
    REQUIRE_THROWS_AS(rt73::read_contacts_csv(is, 13), rt73::EncodeError);
  }
}

TEST_CASE("group csv import", "[bulk][csv]") {
  std::istringstream is{"GROUP_ID,GROUP_NAME\n91,Worldwide\n262,Germany\n"};
  const auto entries = rt73::read_groups_csv(is, 13);
  REQUIRE(entries == std::vector<rt73::BulkEntry>{{91, "Worldwide"},
                                                  {262, "Germany"}});
  const rt73::BulkTable table{rt73map::group_db_map()};
  REQUIRE(table.decode(table.encode(entries)) == entries);
}
