// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Checksum.hpp>
#include <Errors.hpp>
#include <fwd.hpp>

#include <array>
#include <numeric>

#include <fmt/format.h>

namespace rt73 {

namespace {

constexpr auto make_crc_table() noexcept {
  std::array<std::uint16_t, 256> table{};
  for (std::uint16_t i = 0; i < 256; ++i) {
    std::uint16_t crc = i << 8;
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc & 0x8000) ? static_cast<std::uint16_t>((crc << 1) ^ 0x1021)
                           : static_cast<std::uint16_t>(crc << 1);
    }
    table[i] = crc;
  }
  return table;
}

constexpr auto crc_table = make_crc_table();

} // namespace

std::string_view checksum_to_string(ChecksumKind kind) noexcept {
  switch (kind) {
  case ChecksumKind::SUM8:
    return "sum8"sv;
  case ChecksumKind::CRC16_CCITT:
    return "crc16-ccitt"sv;
  }
  return "unknown"sv;
}

ChecksumKind string_to_checksum(std::string_view str) {
  if (str == "sum8"sv) {
    return ChecksumKind::SUM8;
  } else if (str == "crc16-ccitt"sv) {
    return ChecksumKind::CRC16_CCITT;
  }
  throw Error(fmt::format("Invalid checksum algorithm '{}'", str));
}

std::uint8_t sum8(std::span<const std::uint8_t> data) noexcept {
  const auto sum = std::accumulate(data.begin(), data.end(), std::uint8_t{},
                                   [](std::uint8_t acc, std::uint8_t v) {
                                     return static_cast<std::uint8_t>(acc + v);
                                   });
  return static_cast<std::uint8_t>(-sum);
}

std::uint16_t crc16_ccitt(std::span<const std::uint8_t> data) noexcept {
  std::uint16_t crc = 0xFFFF;
  for (const auto b : data) {
    crc = static_cast<std::uint16_t>((crc << 8) ^
                                     crc_table[((crc >> 8) ^ b) & 0xFF]);
  }
  return crc;
}

std::uint16_t checksum(ChecksumKind kind,
                       std::span<const std::uint8_t> data) noexcept {
  return kind == ChecksumKind::SUM8 ? sum8(data) : crc16_ccitt(data);
}

} // namespace rt73
