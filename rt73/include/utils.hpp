// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IDumper.hpp>
#include <Region.hpp>
#include <fwd.hpp>

#include <array>
#include <cctype>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ostream>
#include <ranges>
#include <span>
#include <type_traits>

#include <fmt/format.h>
#include <range/v3/range/concepts.hpp>
#include <range/v3/range/traits.hpp>

// All multi-byte values on the wire and in the codeplug are little endian

template <typename R>
concept byte_range =
    rg::input_range<std::remove_reference_t<R>> &&
    rg::sized_range<std::remove_reference_t<R>> &&
    std::unsigned_integral<rg::range_value_t<std::remove_reference_t<R>>> &&
    sizeof(rg::range_value_t<std::remove_reference_t<R>>) == 1;

// cast a byte range into a builtin integer, where the byte range
// holds a representation in little endian format
template <std::unsigned_integral T, byte_range R>
constexpr auto range_cast(R &&r) noexcept {
  T tmp{};
  auto it = rg::begin(r);
  const auto end = rg::end(r);
  for (size_t i = 0; i != sizeof(T) && it != end; ++i, ++it) {
    tmp += static_cast<T>(static_cast<T>(*it) << i * 8);
  }
  return tmp;
}

// appends the lowest `width` bytes of val in little endian order
template <std::unsigned_integral T>
void append_le(byte_vector &out, T val, std::size_t width = sizeof(T)) {
  std::uint64_t tmp = val;
  for (std::size_t i = 0; i < width; ++i, tmp >>= 8) {
    out.push_back(static_cast<std::uint8_t>(tmp & 0xFF));
  }
}

template <std::unsigned_integral T>
constexpr void store_le(std::span<std::uint8_t> out, T val) noexcept {
  std::uint64_t tmp = val;
  for (auto &b : out) {
    b = static_cast<std::uint8_t>(tmp & 0xFF);
    tmp >>= 8;
  }
}

struct OstreamDumper : IDumper {
  void dump_start() override {}
  void dump_end() override {}
  explicit OstreamDumper(std::ostream &os, std::size_t bytes_per_line = 16)
      : os{os}, bytes_per_line{bytes_per_line} {}

  void dump_region(const Layout::RegionDescriptor &region,
                   std::uint32_t base_address,
                   std::span<const std::uint8_t> data) override {
    os << region << '\n';
    dump_memory(base_address + region.start, data);
  }

  template <std::ranges::forward_range Rng>
    requires(std::integral<rg::range_value_t<Rng>> &&
             sizeof(rg::range_value_t<Rng>) == 1)
  void dump_memory(uint32_t addr, Rng &&data) {
    for (auto &&line : data | rgv::chunk(bytes_per_line)) {
      dump_line(addr, line);
      addr += bytes_per_line;
      os << '\n';
    }
  }

  template <std::ranges::forward_range Rng>
    requires(std::integral<rg::range_value_t<Rng>> &&
             sizeof(rg::range_value_t<Rng>) == 1)
  void dump_line(uint32_t addr, Rng &&data) {
    std::ostream_iterator<char> out(os);
    fmt::format_to(out, "0x{:08x} | ", addr);
    const auto data_size = dump_data_padded(out, data);
    fmt::format_to(out, "| ");
    dump_ascii_padded(data_size, data);
    fmt::format_to(out, " |");
  }

private:
  template <std::ranges::forward_range Rng>
  std::size_t dump_data_padded(std::ostream_iterator<char> out, Rng &&data) {
    std::size_t i = 0;
    for (const auto val : data) {
      fmt::format_to(out, "{:02x} ", static_cast<unsigned>(val & 0xFF));
      ++i;
    }
    for (auto pad = i; pad < bytes_per_line; ++pad) {
      fmt::format_to(out, "   ");
    }
    return i;
  }

  template <std::ranges::forward_range Rng>
  void dump_ascii_padded(std::size_t data_size, Rng &&data) {
    for (const auto v : data) {
      const int val = v & 0xFF;
      os << (isprint(val) ? static_cast<char>(val) : '.');
    }
    for (auto pad = data_size; pad < bytes_per_line; ++pad) {
      os << ' ';
    }
  }
  //////////////
  std::ostream &os;
  std::size_t bytes_per_line{};
};
