// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <RecordSet.hpp>
#include <Region.hpp>
#include <fwd.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace rt73 {

// Bijective mapping between a memory image and its records.
// Blank slots (every byte equal to the region fill) produce no record.
class Codec {
public:
  explicit Codec(Layout::MemoryMap map) : m_map{std::move(map)} {}

  // throws DecodeError
  RecordSet decode(std::span<const std::uint8_t> image) const;
  // throws EncodeError
  byte_vector encode(const RecordSet &records) const;

  // region_bytes spans exactly the region
  std::vector<Record>
  decode_region(const Layout::RegionDescriptor &region,
                std::span<const std::uint8_t> region_bytes) const;
  void encode_region(const Layout::RegionDescriptor &region,
                     const std::vector<Record> &records,
                     std::span<std::uint8_t> region_bytes) const;

  const Layout::MemoryMap &map() const noexcept { return m_map; }

private:
  Layout::MemoryMap m_map;
};

// "67.0", "D023N" style rendering of tone table entries
std::string ctcss_to_string(std::size_t index);
std::string dcs_to_string(std::size_t index, bool inverted);

} // namespace rt73
