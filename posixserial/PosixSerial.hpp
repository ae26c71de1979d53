// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ISerialPort.hpp>

#include <cstdint>
#include <string>

// Raw 8N1 termios port, reads are paced by poll()
class PosixSerial : public ISerialPort {
public:
  PosixSerial(std::string device, std::uint32_t baud);
  ~PosixSerial() override;

  PosixSerial(const PosixSerial &) = delete;
  PosixSerial &operator=(const PosixSerial &) = delete;

  void write(std::span<const std::uint8_t> data) override;
  std::size_t read(std::span<std::uint8_t> buf,
                   std::chrono::milliseconds timeout) override;
  void flush_input() override;
  std::string describe() const override;

private:
  static unsigned translate_baud(std::uint32_t baud);
  void configure(std::uint32_t baud);

  std::string m_device;
  int m_fd{-1};
};
