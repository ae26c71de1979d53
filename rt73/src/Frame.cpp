// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Errors.hpp>
#include <Frame.hpp>
#include <utils.hpp>

#include <fmt/format.h>

#include <limits>

namespace rt73 {

byte_vector encode_frame(const Frame &frame, ChecksumKind kind) {
  if (frame.payload.size() > std::numeric_limits<std::uint16_t>::max()) {
    throw ProtocolError(fmt::format("Frame payload of {} bytes is too large",
                                    frame.payload.size()));
  }
  byte_vector out;
  out.reserve(frame_size(frame.payload.size(), kind));
  out.push_back(frame.opcode);
  append_le(out, frame.address);
  append_le(out, static_cast<std::uint16_t>(frame.payload.size()));
  out.insert(out.end(), frame.payload.begin(), frame.payload.end());
  append_le(out, checksum(kind, out), checksum_width(kind));
  return out;
}

std::uint16_t frame_payload_length(std::span<const std::uint8_t> header) {
  if (header.size() < frame_header_size) {
    throw ProtocolError(
        fmt::format("Truncated frame header ({} bytes)", header.size()));
  }
  return range_cast<std::uint16_t>(header.subspan(5, 2));
}

Frame decode_frame(std::span<const std::uint8_t> bytes, ChecksumKind kind) {
  const auto length = frame_payload_length(bytes);
  if (bytes.size() != frame_size(length, kind)) {
    throw ProtocolError(fmt::format(
        "Frame length mismatch: header announces {} payload bytes, got {} "
        "frame bytes",
        length, bytes.size()));
  }
  const auto body = bytes.first(frame_header_size + length);
  const auto expected = checksum(kind, body);
  const auto received = range_cast<std::uint16_t>(
      bytes.subspan(body.size(), checksum_width(kind)));
  if (expected != received) {
    throw ProtocolError(
        fmt::format("Frame checksum mismatch: expected 0x{:04x}, got 0x{:04x}",
                    expected, received));
  }
  return Frame{bytes[0], range_cast<std::uint32_t>(bytes.subspan(1, 4)),
               byte_vector(body.begin() + frame_header_size, body.end())};
}

} // namespace rt73
