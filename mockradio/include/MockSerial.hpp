// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ISerialPort.hpp>
#include <MockRadio.hpp>

#include <deque>
#include <memory>

// In-process serial link to a MockRadio, replies are available immediately
// so an empty read is a timeout
class MockSerial : public ISerialPort {
public:
  explicit MockSerial(std::shared_ptr<MockRadio> radio);

  static std::shared_ptr<MockSerial> Create(rt73::ProtocolProfile profile = {});

  void write(std::span<const std::uint8_t> data) override;
  std::size_t read(std::span<std::uint8_t> buf,
                   std::chrono::milliseconds timeout) override;
  void flush_input() override;
  std::string describe() const override { return "mock radio"; }

  MockRadio &radio() const noexcept { return *m_radio; }

  // loads MOCK_RADIO_IMAGE (raw codeplug image) into the radio memory
  void load_mock_image();

private:
  std::shared_ptr<MockRadio> m_radio;
  byte_vector m_to_radio;
  std::deque<std::uint8_t> m_from_radio;
};
