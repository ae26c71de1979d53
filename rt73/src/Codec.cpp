// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Codec.hpp>
#include <Errors.hpp>
#include <RT73.hpp>
#include <utils.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <algorithm>
#include <bit>
#include <charconv>
#include <set>

namespace rt73 {

using namespace Layout;

namespace {

constexpr bool printable(std::uint8_t c) noexcept { return c >= 0x20 && c < 0x7F; }

std::uint32_t read_le(std::span<const std::uint8_t> bytes) noexcept {
  return range_cast<std::uint32_t>(bytes);
}

std::uint32_t width_mask(std::uint8_t width) noexcept {
  return width >= 4 ? 0xFFFFFFFFu : (1u << (8 * width)) - 1;
}

std::uint32_t tone_type(std::span<const std::uint8_t> slot,
                        const ToneCode &e) noexcept {
  return static_cast<std::uint32_t>(slot[e.type_offset] & e.type_mask) >>
         std::countr_zero(static_cast<unsigned>(e.type_mask));
}

std::string_view type_name(const FieldValue &v) noexcept {
  switch (v.index()) {
  case 0:
    return "null"sv;
  case 1:
    return "boolean"sv;
  case 2:
    return "integer"sv;
  case 3:
    return "text"sv;
  case 4:
    return "list"sv;
  }
  return "unknown"sv;
}

struct FieldDecoder {
  const MemoryMap &map;
  const RegionDescriptor &region;
  std::uint32_t slot;
  std::span<const std::uint8_t> bytes;
  std::string_view field;

  [[noreturn]] void fail(std::uint32_t offset, std::string_view msg) const {
    throw DecodeError(fmt::format("{}[{}].{}: {}", region.name, slot, field,
                                  msg),
                      region.name, region.slot_offset(slot) + offset);
  }

  FieldValue operator()(const ScaledInt &e) const {
    auto raw = read_le(bytes.subspan(e.offset, e.width));
    if (e.mask) {
      raw = (raw & e.mask) >> std::countr_zero(e.mask);
    }
    if (e.max_raw && raw > *e.max_raw) {
      fail(e.offset, fmt::format("raw value {} exceeds maximum {}", raw,
                                 *e.max_raw));
    }
    return static_cast<std::int64_t>(raw) * e.scale + e.bias;
  }

  FieldValue operator()(const FixedText &e) const {
    const auto text = bytes.subspan(e.offset, e.length);
    const auto term = rg::find(text, e.pad);
    for (auto it = text.begin(); it != term; ++it) {
      if (!printable(*it)) {
        fail(e.offset + static_cast<std::uint32_t>(it - text.begin()),
             fmt::format("non printable character 0x{:02x}", *it));
      }
    }
    for (auto it = term; it != text.end(); ++it) {
      if (*it != e.pad) {
        fail(e.offset + static_cast<std::uint32_t>(it - text.begin()),
             "data after the text terminator");
      }
    }
    return std::string(text.begin(), term);
  }

  FieldValue operator()(const BitFlag &e) const {
    const auto bits = bytes[e.offset] & e.mask;
    if (bits != 0 && bits != e.mask) {
      fail(e.offset, fmt::format("partially set flag mask 0x{:02x}", bits));
    }
    return (bits == e.mask) != e.inverted;
  }

  FieldValue operator()(const Choice &e) const {
    const auto raw = static_cast<std::uint32_t>(bytes[e.offset] & e.mask);
    const auto it =
        rg::find_if(e.options, [raw](const Option &o) { return o.raw == raw; });
    if (it == e.options.end()) {
      fail(e.offset, fmt::format("unknown value 0x{:02x}", raw));
    }
    return std::string{it->label};
  }

  std::optional<std::uint32_t> slot_entry(const SlotRef &e,
                                          std::uint32_t idx) const {
    const auto offset = e.offset + idx * e.entry_stride();
    const auto raw = read_le(bytes.subspan(offset, e.width));
    if (raw == 0) {
      return std::nullopt;
    }
    if (raw <= e.base) {
      fail(offset, fmt::format("reference {} below the first slot of '{}'",
                               raw, e.target));
    }
    const auto count = map.region_for(e.target).slot_count();
    if (raw - e.base > count) {
      fail(offset, fmt::format("reference {} beyond the {} slots of '{}'", raw,
                               count, e.target));
    }
    return raw - e.base - 1;
  }

  FieldValue operator()(const SlotRef &e) const {
    if (!e.is_list()) {
      const auto entry = slot_entry(e, 0);
      return entry ? FieldValue{static_cast<std::int64_t>(*entry)}
                   : FieldValue{std::monostate{}};
    }
    SlotList list;
    list.reserve(e.count);
    for (std::uint32_t i = 0; i < e.count; ++i) {
      list.push_back(slot_entry(e, i));
    }
    while (!list.empty() && !list.back()) {
      list.pop_back();
    }
    return list;
  }

  FieldValue operator()(const ToneCode &e) const {
    const auto raw = bytes[e.offset];
    switch (tone_type(bytes, e)) {
    case 0:
      return static_cast<std::int64_t>(raw);
    case 1:
      if (raw >= rt73map::ctcss_tones.size()) {
        fail(e.offset, fmt::format("CTCSS index {} out of range", raw));
      }
      return ctcss_to_string(raw);
    default:
      if (raw >= rt73map::dcs_codes.size()) {
        fail(e.offset, fmt::format("DCS index {} out of range", raw));
      }
      return dcs_to_string(raw, tone_type(bytes, e) == 3);
    }
  }
};

struct FieldEncoder {
  const MemoryMap &map;
  const RegionDescriptor &region;
  std::uint32_t slot;
  std::span<std::uint8_t> bytes;
  std::string_view field;
  const FieldValue &value;

  [[noreturn]] void fail(std::string_view msg) const {
    throw EncodeError(fmt::format("{}[{}].{}: {}", region.name, slot, field,
                                  msg),
                      region.name, slot, field);
  }

  template <typename T> const T &expect(std::string_view what) const {
    if (const auto *v = std::get_if<T>(&value); v) {
      return *v;
    }
    fail(fmt::format("expects {}, got {}", what, type_name(value)));
  }

  void store_masked(std::uint32_t offset, std::uint8_t width,
                    std::uint32_t mask, std::uint32_t raw) const {
    const auto dst = bytes.subspan(offset, width);
    const auto shifted = raw << std::countr_zero(mask);
    store_le(dst, (read_le(dst) & ~mask) | (shifted & mask));
  }

  void operator()(const ScaledInt &e) const {
    const auto val = expect<std::int64_t>("an integer"sv);
    const auto mask = e.mask ? e.mask : width_mask(e.width);
    const auto shift = std::countr_zero(mask);
    const std::int64_t max = e.max_raw ? *e.max_raw : (mask >> shift);
    // bounds checked before any arithmetic on the caller's value
    const std::int64_t top = e.bias + e.scale * max;
    const auto lo = std::min(e.bias, top);
    const auto hi = std::max(e.bias, top);
    if (val < lo || val > hi) {
      fail(fmt::format("{} is out of range [{}, {}]", val, lo, hi));
    }
    const auto diff = val - e.bias;
    if (diff % e.scale != 0) {
      fail(fmt::format("{} is not representable with scale {} and bias {}",
                       val, e.scale, e.bias));
    }
    const auto raw = static_cast<std::uint32_t>(diff / e.scale);
    if ((static_cast<std::uint64_t>(raw) << shift) & ~std::uint64_t{mask}) {
      fail(fmt::format("{} does not fit the bits of mask 0x{:x}", val, mask));
    }
    store_masked(e.offset, e.width, mask, raw);
  }

  void operator()(const FixedText &e) const {
    const auto &text = expect<std::string>("text"sv);
    if (text.size() > e.length) {
      fail(fmt::format("'{}' is longer than {} characters", text, e.length));
    }
    const auto dst = bytes.subspan(e.offset, e.length);
    rg::fill(dst, e.pad);
    for (const auto [i, c] : text | rgv::enumerate) {
      const auto b = static_cast<std::uint8_t>(c);
      if (!printable(b) || b == e.pad) {
        fail(fmt::format("'{}' contains an invalid character", text));
      }
      dst[i] = b;
    }
  }

  void operator()(const BitFlag &e) const {
    const bool set = expect<bool>("a boolean"sv) != e.inverted;
    bytes[e.offset] = static_cast<std::uint8_t>((bytes[e.offset] & ~e.mask) |
                                                (set ? e.mask : 0));
  }

  void operator()(const Choice &e) const {
    const auto &label = expect<std::string>("a label"sv);
    const auto it = rg::find_if(
        e.options, [&label](const Option &o) { return o.label == label; });
    if (it == e.options.end()) {
      std::string valid;
      for (const auto &o : e.options) {
        valid += fmt::format("{}{}", valid.empty() ? "" : ", ", o.label);
      }
      fail(fmt::format("unknown label '{}' (one of {})", label, valid));
    }
    bytes[e.offset] =
        static_cast<std::uint8_t>((bytes[e.offset] & ~e.mask) | it->raw);
  }

  void store_slot(const SlotRef &e, std::uint32_t idx,
                  std::optional<std::int64_t> target_slot) const {
    std::uint32_t raw = 0;
    if (target_slot) {
      const auto count = map.region_for(e.target).slot_count();
      if (*target_slot < 0 || *target_slot >= count) {
        fail(fmt::format("slot {} is outside the {} slots of '{}'",
                         *target_slot, count, e.target));
      }
      raw = static_cast<std::uint32_t>(*target_slot) + e.base + 1;
    }
    if (raw > width_mask(e.width)) {
      fail(fmt::format("slot {} does not fit {} bytes", *target_slot,
                       e.width));
    }
    store_le(bytes.subspan(e.offset + idx * e.entry_stride(), e.width), raw);
  }

  void operator()(const SlotRef &e) const {
    if (!e.is_list()) {
      if (std::holds_alternative<std::monostate>(value)) {
        store_slot(e, 0, std::nullopt);
      } else {
        store_slot(e, 0, expect<std::int64_t>("a slot index or null"sv));
      }
      return;
    }
    const auto &list = expect<SlotList>("a list of slot indices"sv);
    if (list.size() > e.count) {
      fail(fmt::format("{} entries exceed the {} available", list.size(),
                       e.count));
    }
    for (std::uint32_t i = 0; i < e.count; ++i) {
      const auto entry = i < list.size() ? list[i] : std::nullopt;
      store_slot(e, i,
                 entry ? std::optional<std::int64_t>{*entry} : std::nullopt);
    }
  }

  void operator()(const ToneCode &e) const {
    const auto type = tone_type(bytes, e);
    if (type == 0) {
      const auto raw = expect<std::int64_t>("a raw tone byte"sv);
      if (raw < 0 || raw > 0xFF) {
        fail(fmt::format("raw tone byte {} is out of range", raw));
      }
      bytes[e.offset] = static_cast<std::uint8_t>(raw);
      return;
    }
    const auto &text = expect<std::string>("a tone"sv);
    const auto size = type == 1 ? rt73map::ctcss_tones.size()
                                : rt73map::dcs_codes.size();
    for (std::size_t i = 0; i < size; ++i) {
      const auto candidate =
          type == 1 ? ctcss_to_string(i) : dcs_to_string(i, type == 3);
      if (candidate == text) {
        bytes[e.offset] = static_cast<std::uint8_t>(i);
        return;
      }
    }
    fail(fmt::format("'{}' is not a valid {} tone", text,
                     type == 1 ? "CTCSS"sv : "DCS"sv));
  }
};

bool is_blank(std::span<const std::uint8_t> slot, std::uint8_t fill) {
  return rg::all_of(slot, [fill](std::uint8_t b) { return b == fill; });
}

} // namespace

std::string ctcss_to_string(std::size_t index) {
  const auto tone = rt73map::ctcss_tones.at(index);
  return fmt::format("{}.{}", tone / 10, tone % 10);
}

std::string dcs_to_string(std::size_t index, bool inverted) {
  return fmt::format("D{:03}{}", rt73map::dcs_codes.at(index),
                     inverted ? 'I' : 'N');
}

std::vector<Record>
Codec::decode_region(const RegionDescriptor &region,
                     std::span<const std::uint8_t> region_bytes) const {
  if (region_bytes.size() != region.length) {
    throw DecodeError(fmt::format("Region '{}' needs {} bytes, got {}",
                                  region.name, region.length,
                                  region_bytes.size()),
                      region.name, region.start);
  }
  const auto owned = ownership_mask(region);
  std::vector<Record> records;
  for (std::uint32_t slot = 0; slot < region.slot_count(); ++slot) {
    const auto bytes = region_bytes.subspan(slot * region.stride, region.stride);
    if (is_blank(bytes, region.fill)) {
      continue;
    }
    Record record{slot, {}, {}};
    for (const auto &field : region.fields) {
      record.fields.emplace(
          field.name,
          std::visit(FieldDecoder{m_map, region, slot, bytes, field.name},
                     field.encoding));
    }
    bool reserved_is_fill = true;
    record.reserved.resize(region.stride);
    for (std::uint32_t i = 0; i < region.stride; ++i) {
      record.reserved[i] = bytes[i] & ~owned[i];
      reserved_is_fill &= record.reserved[i] == (region.fill & ~owned[i]);
    }
    if (reserved_is_fill) {
      record.reserved.clear();
    }
    records.push_back(std::move(record));
  }
  return records;
}

void Codec::encode_region(const RegionDescriptor &region,
                          const std::vector<Record> &records,
                          std::span<std::uint8_t> region_bytes) const {
  if (region_bytes.size() != region.length) {
    throw EncodeError(fmt::format("Region '{}' needs {} bytes, got {}",
                                  region.name, region.length,
                                  region_bytes.size()),
                      region.name);
  }
  rg::fill(region_bytes, region.fill);
  const auto owned = ownership_mask(region);
  std::set<std::uint32_t> seen;
  for (const auto &record : records) {
    if (record.slot >= region.slot_count()) {
      throw EncodeError(fmt::format("{}: slot {} is outside the {} slots",
                                    region.name, record.slot,
                                    region.slot_count()),
                        region.name, record.slot);
    }
    if (!seen.insert(record.slot).second) {
      throw EncodeError(fmt::format("{}: slot {} is claimed twice",
                                    region.name, record.slot),
                        region.name, record.slot);
    }
    for (const auto &[name, value] : record.fields) {
      if (rg::find_if(region.fields, [&name](const FieldSpec &f) {
            return f.name == name;
          }) == region.fields.end()) {
        throw EncodeError(fmt::format("{}[{}]: unknown field '{}'",
                                      region.name, record.slot, name),
                          region.name, record.slot, name);
      }
    }
    if (!record.reserved.empty() && record.reserved.size() != region.stride) {
      throw EncodeError(fmt::format("{}[{}]: reserved bytes must be {} long",
                                    region.name, record.slot, region.stride),
                        region.name, record.slot, "reserved");
    }

    auto bytes = region_bytes.subspan(record.slot * region.stride, region.stride);
    for (std::uint32_t i = 0; i < region.stride; ++i) {
      const auto reserved =
          record.reserved.empty() ? region.fill : record.reserved[i];
      if (!record.reserved.empty() && (reserved & owned[i]) != 0) {
        throw EncodeError(
            fmt::format("{}[{}]: reserved byte {} overlaps field bits",
                        region.name, record.slot, i),
            region.name, record.slot, "reserved");
      }
      bytes[i] = reserved & ~owned[i];
    }
    for (const auto &field : region.fields) {
      const auto it = record.fields.find(field.name);
      if (it == record.fields.end()) {
        throw EncodeError(fmt::format("{}[{}]: missing field '{}'",
                                      region.name, record.slot, field.name),
                          region.name, record.slot, field.name);
      }
      std::visit(
          FieldEncoder{m_map, region, record.slot, bytes, field.name,
                       it->second},
          field.encoding);
    }
  }
}

RecordSet Codec::decode(std::span<const std::uint8_t> image) const {
  if (image.size() != m_map.total_size()) {
    throw DecodeError(fmt::format("Image of {} bytes does not match the {} "
                                  "bytes of memory map '{}'",
                                  image.size(), m_map.total_size(),
                                  m_map.name()),
                      m_map.name(), static_cast<std::uint32_t>(image.size()));
  }
  RecordSet result;
  for (const auto &region : m_map.regions()) {
    result.regions.push_back(RegionRecords{
        std::string{region.name},
        decode_region(region, image.subspan(region.start, region.length))});
  }
  return result;
}

byte_vector Codec::encode(const RecordSet &records) const {
  std::set<std::string_view> seen;
  for (const auto &r : records.regions) {
    if (!m_map.find(r.region)) {
      throw EncodeError(fmt::format("Unknown region '{}' in memory map '{}'",
                                    r.region, m_map.name()),
                        r.region);
    }
    if (!seen.insert(r.region).second) {
      throw EncodeError(fmt::format("Region '{}' is listed twice", r.region),
                        r.region);
    }
  }
  static const std::vector<Record> no_records;
  byte_vector image(m_map.total_size());
  for (const auto &region : m_map.regions()) {
    const auto *r = records.find(region.name);
    encode_region(region, r ? r->records : no_records,
                  std::span{image}.subspan(region.start, region.length));
  }
  return image;
}

} // namespace rt73
