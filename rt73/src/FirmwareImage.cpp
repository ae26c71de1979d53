// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Errors.hpp>
#include <FirmwareImage.hpp>

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <limits>

namespace rt73 {

FirmwareImage::FirmwareImage(byte_vector data, std::uint32_t chunk_size)
    : m_data{std::move(data)}, m_chunk_size{chunk_size} {
  if (m_chunk_size == 0) {
    throw FlashError("Firmware chunk size must not be zero", FlashState::IDLE);
  }
  if (m_data.empty()) {
    throw FlashError("Firmware image is empty", FlashState::IDLE);
  }
  if (m_data.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw FlashError(
        fmt::format("Firmware image of {} bytes is too large", m_data.size()),
        FlashState::IDLE);
  }
  m_size = static_cast<std::uint32_t>(m_data.size());
  if (const auto rem = m_data.size() % m_chunk_size; rem != 0) {
    m_data.resize(m_data.size() + m_chunk_size - rem, 0x00);
  }
}

FirmwareImage FirmwareImage::from_file(const std::filesystem::path &path,
                                       std::uint32_t chunk_size) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw Error(fmt::format("Can't open firmware file {}", path.string()));
  }
  byte_vector data{std::istreambuf_iterator<char>(ifs),
                   std::istreambuf_iterator<char>()};
  return FirmwareImage{std::move(data), chunk_size};
}

std::span<const std::uint8_t> FirmwareImage::chunk(std::size_t idx) const {
  if (idx >= chunk_count()) {
    throw FlashError(fmt::format("Chunk {} is beyond the {} chunks of the "
                                 "image",
                                 idx, chunk_count()),
                     FlashState::IDLE, idx);
  }
  return std::span{m_data}.subspan(idx * m_chunk_size, m_chunk_size);
}

std::uint16_t FirmwareImage::chunk_checksum(ChecksumKind kind,
                                            std::size_t idx) const {
  return checksum(kind, chunk(idx));
}

} // namespace rt73
