// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <MockRadio.hpp>

#include <Checksum.hpp>
#include <Errors.hpp>
#include <utils.hpp>

#include <range/v3/algorithm/count_if.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

using rt73::Frame;

MockRadio::MockRadio(rt73::ProtocolProfile profile, std::string ident)
    : m_profile{std::move(profile)}, m_ident{std::move(ident)} {}

std::uint8_t &MockRadio::operator[](std::uint32_t addr) {
  auto [it, inserted] = m_pages.try_emplace(addr / page_size);
  // codeplug memory of a factory radio reads as zeros
  if (inserted) {
    it->second.fill(0x00);
  }
  return it->second[addr % page_size];
}

byte_vector MockRadio::read(std::uint32_t addr, std::size_t length) {
  byte_vector res(length);
  for (std::size_t i = 0; i < length; ++i) {
    res[i] = (*this)[addr + static_cast<std::uint32_t>(i)];
  }
  return res;
}

void MockRadio::write(std::uint32_t addr, std::span<const std::uint8_t> data) {
  for (const auto [i, val] : data | rgv::enumerate) {
    const auto cell = addr + static_cast<std::uint32_t>(i);
    (*this)[cell] = m_bad_cells.contains(cell)
                        ? static_cast<std::uint8_t>(~val)
                        : val;
  }
}

std::size_t MockRadio::count_requests(std::uint8_t opcode) const {
  return static_cast<std::size_t>(rg::count_if(
      m_requests, [opcode](const Frame &f) { return f.opcode == opcode; }));
}

byte_vector MockRadio::handle(std::span<const std::uint8_t> request) {
  Frame frame;
  try {
    frame = rt73::decode_frame(request, m_profile.checksum);
  } catch (const rt73::ProtocolError &e) {
    // a corrupted request is ignored, the host times out and retries
    spdlog::debug("Mock radio ignores request: {}", e.what());
    return {};
  }
  m_requests.push_back(frame);
  const auto reply = dispatch(frame);

  if (m_drop > 0) {
    if (m_drop != forever) {
      --m_drop;
    }
    return {};
  }
  auto bytes = rt73::encode_frame(reply, m_profile.checksum);
  if (m_corrupt > 0) {
    if (m_corrupt != forever) {
      --m_corrupt;
    }
    bytes.back() ^= 0x01;
  }
  return bytes;
}

Frame MockRadio::dispatch(const Frame &request) {
  const auto &ops = m_profile.opcodes;
  if (request.opcode == ops.hello) {
    return ack(request, byte_vector(m_ident.begin(), m_ident.end()));
  } else if (request.opcode == ops.read) {
    return on_read(request);
  } else if (request.opcode == ops.write) {
    return on_write(request);
  } else if (request.opcode == ops.erase) {
    return on_erase(request);
  } else if (request.opcode == ops.program) {
    return on_program(request);
  } else if (request.opcode == ops.verify) {
    return on_verify(request);
  } else if (request.opcode == ops.reset) {
    ++m_resets;
    m_erased = false;
    return ack(request);
  }
  return nak(request, NAK_UNKNOWN_OPCODE);
}

Frame MockRadio::ack(const Frame &request, byte_vector payload) const {
  return Frame{m_profile.opcodes.ack(request.opcode), request.address,
               std::move(payload)};
}

Frame MockRadio::nak(const Frame &request, std::uint8_t code) const {
  return Frame{m_profile.opcodes.nak, request.address, byte_vector{code}};
}

Frame MockRadio::on_read(const Frame &request) {
  if (request.payload.size() != 2) {
    return nak(request, NAK_BAD_REQUEST);
  }
  const auto count = range_cast<std::uint16_t>(request.payload);
  if (count > m_profile.max_payload) {
    return nak(request, NAK_BAD_REQUEST);
  }
  return ack(request, read(request.address, count));
}

Frame MockRadio::on_write(const Frame &request) {
  write(request.address, request.payload);
  return ack(request);
}

Frame MockRadio::on_erase(const Frame &request) {
  if (request.payload.size() != 8) {
    return nak(request, NAK_BAD_REQUEST);
  }
  const auto payload = std::span{request.payload};
  m_expected_chunks = range_cast<std::uint32_t>(payload.first(4));
  const auto image_size = range_cast<std::uint32_t>(payload.subspan(4, 4));
  m_firmware.assign(std::max<std::size_t>(
                        image_size, m_expected_chunks * m_profile.max_payload),
                    0xFF);
  m_programmed.clear();
  m_next_chunk = 0;
  m_erased = true;
  return ack(request);
}

Frame MockRadio::on_program(const Frame &request) {
  if (!m_erased) {
    return nak(request, NAK_NOT_ERASED);
  }
  const auto chunk = request.address / m_profile.max_payload;
  if (request.address % m_profile.max_payload != 0 || chunk != m_next_chunk ||
      chunk >= m_expected_chunks) {
    return nak(request, NAK_OUT_OF_ORDER);
  }
  if (request.address + request.payload.size() > m_firmware.size()) {
    return nak(request, NAK_BAD_REQUEST);
  }
  m_programmed.push_back(chunk);
  if (m_fail_chunk && *m_fail_chunk == chunk) {
    return nak(request, NAK_PROGRAM_FAILED);
  }
  std::copy(request.payload.begin(), request.payload.end(),
            m_firmware.begin() + request.address);
  ++m_next_chunk;
  return ack(request);
}

Frame MockRadio::on_verify(const Frame &request) {
  if (request.payload.size() != 2) {
    return nak(request, NAK_BAD_REQUEST);
  }
  const auto length = range_cast<std::uint16_t>(request.payload);
  if (request.address + length > m_firmware.size()) {
    return nak(request, NAK_BAD_REQUEST);
  }
  const auto stored =
      std::span{m_firmware}.subspan(request.address, length);
  byte_vector payload;
  append_le(payload, rt73::checksum(m_profile.checksum, stored));
  return ack(request, std::move(payload));
}
