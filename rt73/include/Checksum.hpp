// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace rt73 {

enum class ChecksumKind { SUM8, CRC16_CCITT };

std::string_view checksum_to_string(ChecksumKind kind) noexcept;
ChecksumKind string_to_checksum(std::string_view str);

// number of bytes the checksum occupies on the wire
constexpr std::size_t checksum_width(ChecksumKind kind) noexcept {
  return kind == ChecksumKind::SUM8 ? 1 : 2;
}

// two's complement of the byte sum, so that the sum over data and checksum
// is zero (same as the Intel HEX record checksum)
std::uint8_t sum8(std::span<const std::uint8_t> data) noexcept;

// CRC-16/CCITT-FALSE: poly 0x1021, init 0xFFFF, no reflection
std::uint16_t crc16_ccitt(std::span<const std::uint8_t> data) noexcept;

std::uint16_t checksum(ChecksumKind kind,
                       std::span<const std::uint8_t> data) noexcept;

} // namespace rt73
