// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Errors.hpp>
#include <RT73.hpp>

#include <fmt/format.h>

namespace rt73map {

namespace {

inline constexpr std::array<FieldSpec, 2> short_entry_fields{{
    {"id"sv, ScaledInt{.offset = 0x00, .width = 3}},
    {"text"sv, FixedText{.offset = 0x03, .length = 16 - 3}},
}};

inline constexpr std::array<FieldSpec, 2> long_entry_fields{{
    {"id"sv, ScaledInt{.offset = 0x00, .width = 3}},
    {"text"sv, FixedText{.offset = 0x03, .length = max_bulk_record_size - 3}},
}};

Layout::MemoryMap bulk_map(std::string_view name, std::uint32_t base,
                           std::uint32_t capacity,
                           std::uint32_t record_size) {
  const auto entries_length = capacity * record_size;
  return Layout::MemoryMap{
      name,
      base,
      bulk_header_size + entries_length,
      {RegionDescriptor{"header"sv, 0, bulk_header_size, bulk_header_size,
                        bulk_header_fields, 0x00},
       RegionDescriptor{"entries"sv, bulk_header_size, entries_length,
                        record_size,
                        record_size == 16 ? std::span<const FieldSpec>{short_entry_fields}
                                          : std::span<const FieldSpec>{long_entry_fields},
                        0x00}}};
}

} // namespace

Layout::MemoryMap codeplug_map() {
  return Layout::MemoryMap{
      "codeplug"sv, 0x000000, codeplug_size,
      std::vector<RegionDescriptor>(codeplug_regions.begin(),
                                    codeplug_regions.end())};
}

Layout::MemoryMap contact_db_map(std::uint32_t record_size) {
  if (record_size != 16 && record_size != max_bulk_record_size) {
    throw rt73::LayoutError(fmt::format(
        "Unsupported contact record size {}, must be 16 or 128", record_size));
  }
  return bulk_map("ham_contacts"sv, contact_db_base, contact_db_capacity,
                  record_size);
}

Layout::MemoryMap group_db_map() {
  return bulk_map("ham_groups"sv, group_db_base, group_db_capacity, 16);
}

} // namespace rt73map
