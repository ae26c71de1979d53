// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rt73 {

// slot indices, nullopt marks an unused entry
using SlotList = std::vector<std::optional<std::uint32_t>>;

// null | bool | integer | text | slot list
using FieldValue =
    std::variant<std::monostate, bool, std::int64_t, std::string, SlotList>;

struct Record {
  std::uint32_t slot{};
  std::map<std::string, FieldValue, std::less<>> fields;
  // slot bytes not owned by any field, empty when they hold the fill pattern
  byte_vector reserved;

  bool operator==(const Record &) const = default;

  const FieldValue &at(std::string_view field) const;
  FieldValue &at(std::string_view field);
};

struct RegionRecords {
  std::string region;
  std::vector<Record> records;

  bool operator==(const RegionRecords &) const = default;

  Record *find(std::uint32_t slot) noexcept;
  const Record *find(std::uint32_t slot) const noexcept;
};

struct RecordSet {
  std::vector<RegionRecords> regions;

  bool operator==(const RecordSet &) const = default;

  RegionRecords *find(std::string_view region) noexcept;
  const RegionRecords *find(std::string_view region) const noexcept;
  // throws NotFoundError
  RegionRecords &at(std::string_view region);
  const RegionRecords &at(std::string_view region) const;
};

} // namespace rt73
