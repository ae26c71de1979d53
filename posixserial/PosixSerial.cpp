// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "PosixSerial.hpp"

#include <Errors.hpp>
#include <ISerialPort.hpp>

#include <cerrno>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

auto ISerialPort::Create(const std::string &device, std::uint32_t baud)
    -> Ptr {
  return std::make_shared<PosixSerial>(device, baud);
}

PosixSerial::PosixSerial(std::string device, std::uint32_t baud)
    : m_device{std::move(device)} {
  ensure_running();
  m_fd = ::open(m_device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (m_fd < 0) {
    throw rt73::TransportError(fmt::format("Failed to open {} ({})", m_device,
                                           std::strerror(errno)));
  }
  try {
    configure(baud);
  } catch (...) {
    ::close(m_fd);
    throw;
  }
  spdlog::debug("Opened {} at {} baud", m_device, baud);
}

PosixSerial::~PosixSerial() {
  if (m_fd >= 0) {
    ::close(m_fd);
  }
}

unsigned PosixSerial::translate_baud(std::uint32_t baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  case 460800:
    return B460800;
  case 921600:
    return B921600;
  }
  throw rt73::TransportError(fmt::format("Unsupported baud rate {}", baud));
}

void PosixSerial::configure(std::uint32_t baud) {
  termios tio{};
  if (::tcgetattr(m_fd, &tio) != 0) {
    throw rt73::TransportError(fmt::format("tcgetattr failed on {} ({})",
                                           m_device, std::strerror(errno)));
  }
  ::cfmakeraw(&tio);
  const auto speed = translate_baud(baud);
  ::cfsetispeed(&tio, speed);
  ::cfsetospeed(&tio, speed);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  if (::tcsetattr(m_fd, TCSANOW, &tio) != 0) {
    throw rt73::TransportError(fmt::format("tcsetattr failed on {} ({})",
                                           m_device, std::strerror(errno)));
  }
  ::tcflush(m_fd, TCIOFLUSH);
}

void PosixSerial::write(std::span<const std::uint8_t> data) {
  std::size_t written = 0;
  while (written < data.size()) {
    const auto res =
        ::write(m_fd, data.data() + written, data.size() - written);
    if (res < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        pollfd pfd{m_fd, POLLOUT, 0};
        ::poll(&pfd, 1, 100);
        continue;
      }
      throw rt73::TransportError(fmt::format("Write to {} failed ({})",
                                             m_device, std::strerror(errno)));
    }
    written += static_cast<std::size_t>(res);
  }
  ::tcdrain(m_fd);
}

std::size_t PosixSerial::read(std::span<std::uint8_t> buf,
                              std::chrono::milliseconds timeout) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout;
  std::size_t received = 0;
  while (received < buf.size()) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                              clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    pollfd pfd{m_fd, POLLIN, 0};
    const auto pr = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (pr < 0) {
      if (errno == EINTR) {
        // a signal arrived, let the caller decide whether to go on
        break;
      }
      throw rt73::TransportError(fmt::format("poll on {} failed ({})",
                                             m_device, std::strerror(errno)));
    }
    if (pr == 0) {
      break;
    }
    if ((pfd.revents & (POLLHUP | POLLERR)) && !(pfd.revents & POLLIN)) {
      throw rt73::TransportError(
          fmt::format("Device {} disconnected", m_device));
    }
    const auto res =
        ::read(m_fd, buf.data() + received, buf.size() - received);
    if (res < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        continue;
      }
      throw rt73::TransportError(fmt::format("Read from {} failed ({})",
                                             m_device, std::strerror(errno)));
    }
    received += static_cast<std::size_t>(res);
  }
  return received;
}

void PosixSerial::flush_input() { ::tcflush(m_fd, TCIFLUSH); }

std::string PosixSerial::describe() const {
  return fmt::format("serial port {}", m_device);
}
