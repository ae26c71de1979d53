#pragma once

#include <Errors.hpp>
#include <Framer.hpp>
#include <ILink.hpp>
#include <MockRadio.hpp>
#include <MockSerial.hpp>
#include <RecordSet.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace std::literals;

struct TestObjects {
  explicit TestObjects(rt73::ProtocolProfile profile = {})
      : serial(MockSerial::Create(profile)),
        framer(std::make_shared<rt73::Framer>(serial, profile)) {}
  MockRadio &radio() const { return serial->radio(); }
  std::shared_ptr<MockSerial> serial;
  std::shared_ptr<rt73::Framer> framer;
};
inline auto setup(rt73::ProtocolProfile profile = {}) {
  return TestObjects{std::move(profile)};
}

// forwards to another link, recording the size of every write_region call
struct CountingLink : rt73::ILink {
  explicit CountingLink(rt73::ILink &link) : link{link} {}

  byte_vector send_command(std::uint8_t opcode, std::uint32_t address,
                           std::span<const std::uint8_t> payload) override {
    return link.send_command(opcode, address, payload);
  }
  byte_vector read_region(std::uint32_t address,
                          std::uint32_t length) override {
    ++reads;
    return link.read_region(address, length);
  }
  void write_region(std::uint32_t address, std::span<const std::uint8_t> data,
                    std::uint32_t align = 1) override {
    writes.push_back(data.size());
    link.write_region(address, data, align);
  }
  const rt73::ProtocolProfile &profile() const noexcept override {
    return link.profile();
  }

  rt73::ILink &link;
  std::size_t reads{};
  std::vector<std::size_t> writes;
};

inline rt73::Record channel_record(std::uint32_t slot, std::string name) {
  using rt73::FieldValue;
  return rt73::Record{
      slot,
      {{"id", std::int64_t{slot + 1}},
       {"name", std::move(name)},
       {"rx_freq_hz", std::int64_t{446006250}},
       {"tx_freq_hz", std::int64_t{446006250}},
       {"mode", "ANALOG"s},
       {"power", "HIGH"s},
       {"bandwidth", "12.5KHZ"s},
       {"alarm", false},
       {"pct", "PATCS"s},
       {"rx_timeslot", "TS1"s},
       {"rx_color_code", std::int64_t{1}},
       {"confirmed_data", false},
       {"tx_policy", "IMPOLITE"s},
       {"rx_group", std::int64_t{0}},
       {"scan_list", std::monostate{}},
       {"rx_only", false},
       {"emergency_system", "NONE"s},
       {"tx_tone_type", "CTCSS"s},
       {"rx_tone_type", "DCS"s},
       {"rx_tone", "D023N"s},
       {"tx_tone", "67.0"s},
       {"rx_timeslot_auto", false},
       {"tx_timeslot", "TS1"s},
       {"tx_timeslot_auto", true},
       {"tx_color_code", std::int64_t{1}},
       {"default_contact", std::int64_t{1}},
       {"aprs_report", std::int64_t{0}}},
      {}};
}

// a small but cross-referencing codeplug in decoded form
inline rt73::RecordSet sample_records() {
  rt73::RecordSet set;
  set.regions = {
      {"info",
       {{0,
         {{"factory_number", "F123"s},
          {"serial_number", "S456"s},
          {"model", "RT73"s},
          {"firmware_version", "V1.0"s},
          {"cps_version", "V1.0"s},
          {"frequency_range", "400-480"s},
          {"update_date", "2024-01-01"s},
          {"firmware_id", "ID"s}},
         {}}}},
      {"settings", {}},
      {"messages_ext", {}},
      {"aprs_channels", {}},
      {"aprs", {}},
      {"reserved_a", {}},
      {"dmr_service", {}},
      {"messages", {{3, {{"text", "Hello"s}}, {}}}},
      {"reserved_b", {}},
      {"dmr_settings", {}},
      {"scan_lists", {}},
      {"rx_groups",
       {{0,
         {{"name", "Group"s},
          {"contacts", rt73::SlotList{0u, std::nullopt, 1u}}},
         {}}}},
      {"reserved_c", {}},
      {"contacts",
       {{0,
         {{"id", std::int64_t{1}},
          {"call_type", "GROUP"s},
          {"name", "Local TG"s},
          {"dmr_id", std::int64_t{9}}},
         {}},
        {1,
         {{"id", std::int64_t{2}},
          {"call_type", "PRIVATE"s},
          {"name", "Friend"s},
          {"dmr_id", std::int64_t{2345678}}},
         {}}}},
      {"reserved_d", {}},
      {"zones",
       {{0,
         {{"id", std::int64_t{1}},
          {"name", "Zone 1"s},
          {"first_channel", std::int64_t{0}},
          {"channel_count", std::int64_t{2}}},
         {}}}},
      {"channels", {channel_record(0, "Local"), channel_record(1, "Repeater")}},
  };
  return set;
}
