// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <span>
#include <string>

struct ISerialPort {
  using Ptr = std::shared_ptr<ISerialPort>;

  struct Interrupted : std::exception {
    const char *what() const noexcept override {
      return "Serial transfer interrupted";
    }
  };

  // writes every byte or throws rt73::TransportError
  virtual void write(std::span<const std::uint8_t> data) = 0;

  // Blocks until buf is full or the timeout expires, returns the number of
  // bytes read. Returning less than buf.size() means the timeout expired.
  virtual std::size_t read(std::span<std::uint8_t> buf,
                           std::chrono::milliseconds timeout) = 0;

  // drops any received but unread bytes
  virtual void flush_input() = 0;

  virtual std::string describe() const = 0;

  static Ptr Create(const std::string &device, std::uint32_t baud);

  // SIGINT/SIGTERM request a stop, honoured by ensure_running()
  static void install_signal_handlers();
  static void request_stop() noexcept;
  // throws Interrupted once after a stop was requested
  static void ensure_running();

  virtual ~ISerialPort() = default;
};
