// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Checksum.hpp>
#include <fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace rt73 {

// opcode u8 | address u32 | length u16 | payload | checksum
struct Frame {
  std::uint8_t opcode{};
  std::uint32_t address{};
  byte_vector payload;

  bool operator==(const Frame &) const = default;
};

inline constexpr std::size_t frame_header_size = 7;

constexpr std::size_t frame_size(std::size_t payload_size,
                                 ChecksumKind kind) noexcept {
  return frame_header_size + payload_size + checksum_width(kind);
}

byte_vector encode_frame(const Frame &frame, ChecksumKind kind);

// payload length announced by a frame header
std::uint16_t frame_payload_length(std::span<const std::uint8_t> header);

// Parses one complete frame, throws ProtocolError when the length field or
// the checksum does not match the bytes
Frame decode_frame(std::span<const std::uint8_t> bytes, ChecksumKind kind);

} // namespace rt73
