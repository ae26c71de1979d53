// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Errors.hpp>
#include <Framer.hpp>
#include <utils.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace rt73 {

namespace {

enum class Failure { NONE, TIMEOUT, CORRUPT };

} // namespace

Framer::Framer(ISerialPort::Ptr port, ProtocolProfile profile)
    : m_port{std::move(port)}, m_profile{std::move(profile)} {
  if (!m_port) {
    throw TransportError("Framer needs a serial port");
  }
}

byte_vector Framer::send_command(std::uint8_t opcode, std::uint32_t address,
                                 std::span<const std::uint8_t> payload) {
  return transact(Frame{opcode, address, {payload.begin(), payload.end()}})
      .payload;
}

byte_vector Framer::read_region(std::uint32_t address, std::uint32_t length) {
  byte_vector result;
  result.reserve(length);
  for (std::uint32_t offset = 0; offset < length;) {
    const auto count = static_cast<std::uint16_t>(
        std::min<std::uint32_t>(m_profile.max_payload, length - offset));
    byte_vector request;
    append_le(request, count);
    auto response = transact(
        Frame{m_profile.opcodes.read, address + offset, std::move(request)},
        count);
    result.insert(result.end(), response.payload.begin(),
                  response.payload.end());
    offset += count;
  }
  return result;
}

std::uint32_t Framer::write_chunk_size(std::uint32_t align) const {
  const std::uint32_t max = m_profile.max_payload;
  if (!m_profile.record_atomic_writes || align <= 1) {
    return max;
  }
  if (align > max) {
    throw LayoutError(
        fmt::format("Record of {} bytes does not fit a {} byte frame", align,
                    max));
  }
  return max - max % align;
}

void Framer::write_region(std::uint32_t address,
                          std::span<const std::uint8_t> data,
                          std::uint32_t align) {
  const auto chunk = write_chunk_size(align);
  for (std::size_t offset = 0; offset < data.size();) {
    const auto count = std::min<std::size_t>(chunk, data.size() - offset);
    const auto part = data.subspan(offset, count);
    transact(Frame{m_profile.opcodes.write,
                   address + static_cast<std::uint32_t>(offset),
                   {part.begin(), part.end()}},
             0);
    offset += count;
  }
}

Frame Framer::transact(const Frame &request,
                       std::optional<std::size_t> expected_payload) {
  // cancellation is only honoured between frames
  ISerialPort::ensure_running();
  const auto wire = encode_frame(request, m_profile.checksum);
  const auto &ops = m_profile.opcodes;

  auto failure = Failure::NONE;
  std::string failure_msg;
  for (unsigned attempt = 1; attempt <= m_profile.attempts; ++attempt) {
    if (attempt > 1) {
      ++m_stats.retries;
      spdlog::warn("Retrying opcode 0x{:02x} at 0x{:08x} ({}/{}): {}",
                   request.opcode, request.address, attempt,
                   m_profile.attempts, failure_msg);
      m_port->flush_input();
    }
    spdlog::trace("-> opcode 0x{:02x} address 0x{:08x} length {}",
                  request.opcode, request.address, request.payload.size());
    m_port->write(wire);
    ++m_stats.frames_sent;

    std::optional<Frame> response;
    try {
      response = receive();
    } catch (const ProtocolError &e) {
      ++m_stats.corrupt_responses;
      failure = Failure::CORRUPT;
      failure_msg = e.what();
      continue;
    }
    if (!response) {
      ++m_stats.timeouts;
      failure = Failure::TIMEOUT;
      failure_msg = fmt::format("no response within {} ms",
                                m_profile.timeout.count());
      continue;
    }
    spdlog::trace("<- opcode 0x{:02x} address 0x{:08x} length {}",
                  response->opcode, response->address,
                  response->payload.size());

    if (response->opcode == ops.nak) {
      const auto code = response->payload.empty() ? 0 : response->payload[0];
      throw DeviceError(
          fmt::format("Device rejected opcode 0x{:02x} at 0x{:08x} with error "
                      "code 0x{:02x}",
                      request.opcode, request.address, code),
          code);
    }
    if (response->opcode != ops.ack(request.opcode) ||
        response->address != request.address) {
      ++m_stats.corrupt_responses;
      failure = Failure::CORRUPT;
      failure_msg = fmt::format(
          "unexpected reply opcode 0x{:02x} address 0x{:08x}",
          response->opcode, response->address);
      continue;
    }
    if (expected_payload && response->payload.size() != *expected_payload) {
      ++m_stats.corrupt_responses;
      failure = Failure::CORRUPT;
      failure_msg =
          fmt::format("reply carries {} bytes instead of {}",
                      response->payload.size(), *expected_payload);
      continue;
    }
    return std::move(*response);
  }

  const auto msg = fmt::format(
      "Opcode 0x{:02x} at 0x{:08x} failed after {} attempts: {}",
      request.opcode, request.address, m_profile.attempts, failure_msg);
  if (failure == Failure::TIMEOUT) {
    throw TransportError(msg);
  }
  throw ProtocolError(msg);
}

std::optional<Frame> Framer::receive() {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + m_profile.timeout;
  const auto remaining = [deadline] {
    return std::max(std::chrono::milliseconds{0},
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - clock::now()));
  };

  byte_vector buf(frame_header_size);
  if (m_port->read(buf, remaining()) != buf.size()) {
    return std::nullopt;
  }
  const auto length = frame_payload_length(buf);
  if (length > m_profile.max_payload) {
    throw ProtocolError(
        fmt::format("Reply announces {} payload bytes, maximum is {}", length,
                    m_profile.max_payload));
  }
  const auto rest = length + checksum_width(m_profile.checksum);
  buf.resize(frame_header_size + rest);
  if (m_port->read(std::span{buf}.subspan(frame_header_size), remaining()) !=
      rest) {
    return std::nullopt;
  }
  return decode_frame(buf, m_profile.checksum);
}

} // namespace rt73
