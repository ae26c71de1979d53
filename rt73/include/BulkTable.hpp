// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Codec.hpp>
#include <Region.hpp>
#include <fwd.hpp>

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>

namespace rt73 {

struct BulkEntry {
  std::uint32_t id{};
  std::string text;

  bool operator==(const BulkEntry &) const = default;
};

// Ham contact / ham group tables: a header carrying the entry count and the
// record size, followed by `count` records of a 24 bit id and NUL padded text.
// Only the used prefix of the table is ever encoded.
class BulkTable {
public:
  explicit BulkTable(Layout::MemoryMap map);

  std::uint32_t record_size() const noexcept { return m_entries.stride; }
  std::uint32_t capacity() const noexcept { return m_entries.slot_count(); }
  std::size_t text_capacity() const noexcept;

  // header followed by the entries, throws EncodeError
  byte_vector encode(std::span<const BulkEntry> entries) const;
  // throws DecodeError
  std::vector<BulkEntry> decode(std::span<const std::uint8_t> bytes) const;

  const Layout::MemoryMap &map() const noexcept { return m_codec.map(); }

private:
  Codec m_codec;
  Layout::RegionDescriptor m_header;
  Layout::RegionDescriptor m_entries;
};

// RadioID.net user export (RADIO_ID, CALLSIGN, FIRST_NAME, LAST_NAME, CITY,
// STATE, COUNTRY), text is truncated to text_capacity
std::vector<BulkEntry> read_contacts_csv(std::istream &is,
                                         std::size_t text_capacity);
// GROUP_ID, GROUP_NAME
std::vector<BulkEntry> read_groups_csv(std::istream &is,
                                       std::size_t text_capacity);

// splits one CSV line, honouring double quoted fields
std::vector<std::string> split_csv_line(std::string_view line);

} // namespace rt73
