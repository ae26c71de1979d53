// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Layout {

struct Option {
  std::uint32_t raw{};
  std::string_view label;
};

// Little endian unsigned integer, value = raw * scale + bias.
// A zero mask selects every bit of the field.
struct ScaledInt {
  std::uint32_t offset{};
  std::uint8_t width{1};
  std::uint32_t mask{};
  std::int64_t scale{1};
  std::int64_t bias{};
  std::optional<std::uint32_t> max_raw{};
};

// Text terminated by the pad byte, or filling the whole field
struct FixedText {
  std::uint32_t offset{};
  std::uint32_t length{};
  std::uint8_t pad{0x00};
};

struct BitFlag {
  std::uint32_t offset{};
  std::uint8_t mask{};
  bool inverted{};
};

struct Choice {
  std::uint32_t offset{};
  std::uint8_t mask{};
  std::span<const Option> options{};
};

// Reference into another region's slots stored as base + slot + 1,
// 0 means none. count > 1 makes it a list with entries stride bytes apart.
struct SlotRef {
  std::uint32_t offset{};
  std::uint8_t width{1};
  std::string_view target;
  std::uint32_t count{1};
  std::uint32_t stride{};
  std::uint32_t base{};

  constexpr std::uint32_t entry_stride() const noexcept {
    return stride ? stride : width;
  }
  constexpr bool is_list() const noexcept { return count > 1; }
};

// CTCSS/DCS table index, interpreted by the tone type bits at
// type_offset/type_mask (0 off, 1 CTCSS, 2 DCS normal, 3 DCS inverted)
struct ToneCode {
  std::uint32_t offset{};
  std::uint32_t type_offset{};
  std::uint8_t type_mask{};
};

using Encoding =
    std::variant<ScaledInt, FixedText, BitFlag, Choice, SlotRef, ToneCode>;

struct FieldSpec {
  std::string_view name;
  Encoding encoding;
};

struct RegionDescriptor {
  std::string_view name;
  std::uint32_t start{};
  std::uint32_t length{};
  std::uint32_t stride{};
  std::span<const FieldSpec> fields{};
  std::uint8_t fill{0x00};

  constexpr auto end() const noexcept { return start + length; }
  constexpr auto slot_count() const noexcept {
    return stride ? length / stride : 0;
  }
  constexpr auto slot_offset(std::uint32_t slot) const noexcept {
    return start + slot * stride;
  }
  constexpr bool contains(std::uint32_t offset) const noexcept {
    return offset >= start && offset < end();
  }
};

inline std::ostream &operator<<(std::ostream &os, const RegionDescriptor &r) {
  return os << fmt::format(
             "Region name:{} address:[{:06x}h,{:06x}h)  stride: {}  slots: {}",
             r.name, r.start, r.end(), r.stride, r.slot_count());
}

namespace detail {
template <std::size_t N>
constexpr bool regions_in_order(const std::array<RegionDescriptor, N> &regions,
                                std::size_t idx = 0) noexcept {
  return idx + 1 >= N ||
         (regions[idx].end() <= regions[idx + 1].start &&
          regions_in_order(regions, idx + 1));
}
} // namespace detail

template <std::size_t N>
constexpr bool in_order(const std::array<RegionDescriptor, N> &regions) noexcept {
  return detail::regions_in_order(regions);
}

// Per byte mask of the bits owned by the region's fields.
// Throws LayoutError on overlapping fields or fields outside the stride.
byte_vector ownership_mask(const RegionDescriptor &region);

class MemoryMap {
public:
  using RegionRef = std::reference_wrapper<const RegionDescriptor>;

  // Validates the layout, throws LayoutError on any inconsistency
  MemoryMap(std::string_view name, std::uint32_t base_address,
            std::uint32_t total_size, std::vector<RegionDescriptor> regions);

  std::string_view name() const noexcept { return m_name; }
  std::uint32_t base_address() const noexcept { return m_base_address; }
  std::uint32_t total_size() const noexcept { return m_total_size; }

  std::span<const RegionDescriptor> regions() const noexcept {
    return m_regions;
  }

  // throws NotFoundError
  const RegionDescriptor &region_for(std::string_view name) const;

  std::optional<RegionRef> find(std::string_view name) const noexcept;

  // region holding the image offset, throws NotFoundError past the end
  const RegionDescriptor &region_at(std::uint32_t offset) const;

  std::uint32_t address_of(const RegionDescriptor &region,
                           std::uint32_t offset = 0) const noexcept {
    return m_base_address + region.start + offset;
  }

private:
  void validate() const;
  void validate_region(const RegionDescriptor &region) const;

  std::string m_name;
  std::uint32_t m_base_address{};
  std::uint32_t m_total_size{};
  std::vector<RegionDescriptor> m_regions;
};

} // namespace Layout
