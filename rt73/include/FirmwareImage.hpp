// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Checksum.hpp>
#include <fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

namespace rt73 {

// Vendor firmware binary split into fixed size chunks, the last one padded
// with 0x00
class FirmwareImage {
public:
  FirmwareImage(byte_vector data, std::uint32_t chunk_size);

  static FirmwareImage from_file(const std::filesystem::path &path,
                                 std::uint32_t chunk_size);

  // unpadded size
  std::uint32_t size() const noexcept { return m_size; }
  std::uint32_t chunk_size() const noexcept { return m_chunk_size; }
  std::size_t chunk_count() const noexcept {
    return m_data.size() / m_chunk_size;
  }
  std::uint32_t chunk_address(std::size_t idx) const noexcept {
    return static_cast<std::uint32_t>(idx * m_chunk_size);
  }

  std::span<const std::uint8_t> chunk(std::size_t idx) const;
  std::uint16_t chunk_checksum(ChecksumKind kind, std::size_t idx) const;

private:
  byte_vector m_data;
  std::uint32_t m_size{};
  std::uint32_t m_chunk_size{};
};

} // namespace rt73
