// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Checksum.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace rt73 {

struct Opcodes {
  std::uint8_t hello{0x01};
  std::uint8_t read{0x10};
  std::uint8_t write{0x11};
  std::uint8_t erase{0x20};
  std::uint8_t program{0x21};
  std::uint8_t verify{0x22};
  std::uint8_t reset{0x2F};
  // set on the opcode of a successful reply
  std::uint8_t ack_flag{0x80};
  std::uint8_t nak{0x7F};

  constexpr std::uint8_t ack(std::uint8_t request) const noexcept {
    return request | ack_flag;
  }
};

struct ProtocolProfile {
  std::string version{"rt73-1"};
  Opcodes opcodes{};
  ChecksumKind checksum{ChecksumKind::CRC16_CCITT};
  // largest payload of a single frame
  std::uint16_t max_payload{2048};
  // total transmissions of one frame before giving up
  unsigned attempts{3};
  std::chrono::milliseconds timeout{10000};
  bool readback_verify{true};
  bool record_atomic_writes{true};
  // upper bound of one write_region call issued by the session
  std::uint32_t max_region_write{1u << 20};
  std::uint32_t baud{115200};
};

// Reads a JSON profile, keys missing from the document keep their defaults
ProtocolProfile load_profile(std::istream &is);
ProtocolProfile load_profile(const std::filesystem::path &path);

std::string dump_profile(const ProtocolProfile &profile);

} // namespace rt73
