// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Errors.hpp>
#include <Region.hpp>

#include <fmt/format.h>

#include <range/v3/algorithm/find_if.hpp>

#include <set>

namespace Layout {

namespace {

struct OwnershipBuilder {
  const RegionDescriptor &region;
  std::string_view field;
  byte_vector &owned;

  void claim(std::uint32_t offset, std::uint8_t mask) {
    if (offset >= region.stride) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' exceeds the {} byte stride (offset {})",
          field, region.name, region.stride, offset));
    }
    if ((owned[offset] & mask) != 0) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' overlaps another field at offset {} "
          "(mask 0x{:02x})",
          field, region.name, offset, owned[offset] & mask));
    }
    owned[offset] |= mask;
  }

  void claim_bytes(std::uint32_t offset, std::uint32_t count) {
    for (std::uint32_t i = 0; i < count; ++i) {
      claim(offset + i, 0xFF);
    }
  }

  void operator()(const ScaledInt &e) {
    if (e.width == 0 || e.width > 4) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' has unsupported width {}", field,
          region.name, e.width));
    }
    if (e.scale == 0) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' has zero scale", field, region.name));
    }
    const std::uint64_t width_mask = (std::uint64_t{1} << (8 * e.width)) - 1;
    const std::uint64_t mask = e.mask ? e.mask : width_mask;
    if ((mask & ~width_mask) != 0) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' has mask 0x{:x} wider than {} bytes",
          field, region.name, mask, e.width));
    }
    for (std::uint32_t i = 0; i < e.width; ++i) {
      if (const auto m = static_cast<std::uint8_t>(mask >> (8 * i)); m) {
        claim(e.offset + i, m);
      }
    }
  }

  void operator()(const FixedText &e) {
    if (e.length == 0) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' has zero length", field, region.name));
    }
    claim_bytes(e.offset, e.length);
  }

  void operator()(const BitFlag &e) {
    if (e.mask == 0) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' has an empty mask", field, region.name));
    }
    claim(e.offset, e.mask);
  }

  void operator()(const Choice &e) {
    if (e.mask == 0 || e.options.empty()) {
      throw rt73::LayoutError(
          fmt::format("Field '{}' of region '{}' has no mask or no options",
                      field, region.name));
    }
    std::set<std::uint32_t> raws;
    std::set<std::string_view> labels;
    for (const auto &opt : e.options) {
      if ((opt.raw & ~std::uint32_t{e.mask}) != 0 ||
          !raws.insert(opt.raw).second || !labels.insert(opt.label).second) {
        throw rt73::LayoutError(fmt::format(
            "Field '{}' of region '{}' has an invalid option {} (0x{:02x})",
            field, region.name, opt.label, opt.raw));
      }
    }
    claim(e.offset, e.mask);
  }

  void operator()(const SlotRef &e) {
    if (e.width == 0 || e.width > 4 || e.count == 0 ||
        e.entry_stride() < e.width) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' has an invalid slot reference shape",
          field, region.name));
    }
    for (std::uint32_t i = 0; i < e.count; ++i) {
      claim_bytes(e.offset + i * e.entry_stride(), e.width);
    }
  }

  void operator()(const ToneCode &e) {
    if (e.type_offset >= region.stride || e.type_mask == 0) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' has an invalid tone type location", field,
          region.name));
    }
    claim(e.offset, 0xFF);
  }
};

} // namespace

byte_vector ownership_mask(const RegionDescriptor &region) {
  byte_vector owned(region.stride, 0x00);
  for (const auto &field : region.fields) {
    std::visit(OwnershipBuilder{region, field.name, owned}, field.encoding);
  }
  return owned;
}

MemoryMap::MemoryMap(std::string_view name, std::uint32_t base_address,
                     std::uint32_t total_size,
                     std::vector<RegionDescriptor> regions)
    : m_name{name}, m_base_address{base_address}, m_total_size{total_size},
      m_regions{std::move(regions)} {
  validate();
}

void MemoryMap::validate() const {
  if (m_regions.empty()) {
    throw rt73::LayoutError(fmt::format("Memory map '{}' is empty", m_name));
  }
  std::uint32_t expected_start = 0;
  std::set<std::string_view> names;
  for (const auto &region : m_regions) {
    if (!names.insert(region.name).second) {
      throw rt73::LayoutError(fmt::format(
          "Memory map '{}' declares region '{}' twice", m_name, region.name));
    }
    if (region.start < expected_start) {
      throw rt73::LayoutError(fmt::format(
          "Region '{}' at {:06x}h overlaps the previous region ending at "
          "{:06x}h",
          region.name, region.start, expected_start));
    }
    if (region.start > expected_start) {
      throw rt73::LayoutError(
          fmt::format("Gap [{:06x}h,{:06x}h) before region '{}'",
                      expected_start, region.start, region.name));
    }
    validate_region(region);
    expected_start = region.end();
  }
  if (expected_start != m_total_size) {
    throw rt73::LayoutError(
        fmt::format("Memory map '{}' covers {} bytes instead of {}", m_name,
                    expected_start, m_total_size));
  }
}

void MemoryMap::validate_region(const RegionDescriptor &region) const {
  if (region.length == 0 || region.stride == 0 ||
      region.length % region.stride != 0) {
    throw rt73::LayoutError(fmt::format(
        "Region '{}' length {} is not a multiple of its stride {}",
        region.name, region.length, region.stride));
  }
  std::set<std::string_view> fields;
  for (const auto &field : region.fields) {
    if (!fields.insert(field.name).second || field.name == "slot"sv ||
        field.name == "reserved"sv) {
      throw rt73::LayoutError(fmt::format(
          "Region '{}' has a duplicate or reserved field name '{}'",
          region.name, field.name));
    }
    if (const auto *ref = std::get_if<SlotRef>(&field.encoding);
        ref && !find(ref->target)) {
      throw rt73::LayoutError(fmt::format(
          "Field '{}' of region '{}' references unknown region '{}'",
          field.name, region.name, ref->target));
    }
  }
  // throws on overlap
  static_cast<void>(ownership_mask(region));
}

const RegionDescriptor &MemoryMap::region_for(std::string_view name) const {
  if (const auto r = find(name); r) {
    return r->get();
  }
  throw rt73::NotFoundError(
      fmt::format("No region named '{}' in memory map '{}'", name, m_name));
}

auto MemoryMap::find(std::string_view name) const noexcept
    -> std::optional<RegionRef> {
  const auto it = rg::find_if(
      m_regions, [name](const auto &r) { return r.name == name; });
  if (it == m_regions.end()) {
    return std::nullopt;
  }
  return std::cref(*it);
}

const RegionDescriptor &MemoryMap::region_at(std::uint32_t offset) const {
  const auto it = rg::find_if(
      m_regions, [offset](const auto &r) { return r.contains(offset); });
  if (it == m_regions.end()) {
    throw rt73::NotFoundError(fmt::format(
        "Offset {:06x}h is outside memory map '{}'", offset, m_name));
  }
  return *it;
}

} // namespace Layout
