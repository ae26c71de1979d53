// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Errors.hpp>
#include <RecordSet.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>

namespace rt73 {

const FieldValue &Record::at(std::string_view field) const {
  if (const auto it = fields.find(field); it != fields.end()) {
    return it->second;
  }
  throw NotFoundError(
      fmt::format("Record in slot {} has no field '{}'", slot, field));
}

FieldValue &Record::at(std::string_view field) {
  return const_cast<FieldValue &>(std::as_const(*this).at(field));
}

Record *RegionRecords::find(std::uint32_t slot) noexcept {
  return const_cast<Record *>(std::as_const(*this).find(slot));
}

const Record *RegionRecords::find(std::uint32_t slot) const noexcept {
  const auto it =
      rg::find_if(records, [slot](const Record &r) { return r.slot == slot; });
  return it == records.end() ? nullptr : &*it;
}

RegionRecords *RecordSet::find(std::string_view region) noexcept {
  return const_cast<RegionRecords *>(std::as_const(*this).find(region));
}

const RegionRecords *RecordSet::find(std::string_view region) const noexcept {
  const auto it = rg::find_if(
      regions, [region](const RegionRecords &r) { return r.region == region; });
  return it == regions.end() ? nullptr : &*it;
}

RegionRecords &RecordSet::at(std::string_view region) {
  return const_cast<RegionRecords &>(std::as_const(*this).at(region));
}

const RegionRecords &RecordSet::at(std::string_view region) const {
  if (const auto *r = find(region); r) {
    return *r;
  }
  throw NotFoundError(fmt::format("Record set has no region '{}'", region));
}

} // namespace rt73
