// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <MockSerial.hpp>

#include <Errors.hpp>
#include <Frame.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>

__attribute__((weak)) ISerialPort::Ptr
ISerialPort::Create(const std::string &device, std::uint32_t baud) {
  rt73::ProtocolProfile profile{};
  if (const auto path = std::getenv("MOCK_RADIO_PROFILE"); path) {
    profile = rt73::load_profile(std::filesystem::path{path});
  }
  auto serial = MockSerial::Create(std::move(profile));
  serial->load_mock_image();
  spdlog::info("Using mock radio instead of {} ({} baud)", device, baud);
  return serial;
}

MockSerial::MockSerial(std::shared_ptr<MockRadio> radio)
    : m_radio{std::move(radio)} {}

std::shared_ptr<MockSerial> MockSerial::Create(rt73::ProtocolProfile profile) {
  return std::make_shared<MockSerial>(
      std::make_shared<MockRadio>(std::move(profile)));
}

void MockSerial::load_mock_image() {
  const auto image = std::getenv("MOCK_RADIO_IMAGE");
  if (!image) {
    return;
  }
  std::ifstream ifs(image, std::ios::binary);
  if (!ifs) {
    throw rt73::TransportError(
        fmt::format("Can't open mock radio image {}", image));
  }
  const byte_vector data{std::istreambuf_iterator<char>(ifs),
                         std::istreambuf_iterator<char>()};
  m_radio->write(0, data);
}

void MockSerial::write(std::span<const std::uint8_t> data) {
  ensure_running();
  m_to_radio.insert(m_to_radio.end(), data.begin(), data.end());
  const auto checksum = m_radio->profile().checksum;
  while (m_to_radio.size() >= rt73::frame_header_size) {
    const auto total = rt73::frame_size(
        rt73::frame_payload_length(m_to_radio), checksum);
    if (m_to_radio.size() < total) {
      break;
    }
    const auto reply =
        m_radio->handle(std::span{m_to_radio}.first(total));
    m_to_radio.erase(m_to_radio.begin(),
                     m_to_radio.begin() + static_cast<std::ptrdiff_t>(total));
    m_from_radio.insert(m_from_radio.end(), reply.begin(), reply.end());
  }
}

std::size_t MockSerial::read(std::span<std::uint8_t> buf,
                             std::chrono::milliseconds) {
  const auto n = std::min(buf.size(), m_from_radio.size());
  std::copy_n(m_from_radio.begin(), n, buf.begin());
  m_from_radio.erase(m_from_radio.begin(),
                     m_from_radio.begin() + static_cast<std::ptrdiff_t>(n));
  return n;
}

void MockSerial::flush_input() { m_from_radio.clear(); }
