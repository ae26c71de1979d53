// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Frame.hpp>
#include <Protocol.hpp>
#include <fwd.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

// Device side of the framed protocol with a sparse memory image
class MockRadio {
public:
  static constexpr std::size_t forever = std::numeric_limits<std::size_t>::max();

  enum NakCode : std::uint8_t {
    NAK_UNKNOWN_OPCODE = 0x01,
    NAK_NOT_ERASED = 0x02,
    NAK_OUT_OF_ORDER = 0x03,
    NAK_PROGRAM_FAILED = 0x04,
    NAK_BAD_REQUEST = 0x05,
  };

  explicit MockRadio(rt73::ProtocolProfile profile = {},
                     std::string ident = "RT73 MOCK");

  // Processes one complete request frame, returns the reply bytes
  // (empty when the reply is dropped)
  byte_vector handle(std::span<const std::uint8_t> request);

  const rt73::ProtocolProfile &profile() const noexcept { return m_profile; }

  // memory access
  std::uint8_t &operator[](std::uint32_t addr);
  byte_vector read(std::uint32_t addr, std::size_t length);
  void write(std::uint32_t addr, std::span<const std::uint8_t> data);

  // fault injection
  void drop_responses(std::size_t count) { m_drop = count; }
  void corrupt_responses(std::size_t count) { m_corrupt = count; }
  // writes to addr store the inverted value
  void corrupt_writes_at(std::uint32_t addr) { m_bad_cells.insert(addr); }
  void fail_program_at(std::size_t chunk) { m_fail_chunk = chunk; }

  // observation
  const std::vector<rt73::Frame> &requests() const noexcept {
    return m_requests;
  }
  std::size_t count_requests(std::uint8_t opcode) const;
  const std::vector<std::size_t> &programmed_chunks() const noexcept {
    return m_programmed;
  }
  const byte_vector &firmware() const noexcept { return m_firmware; }
  bool erased() const noexcept { return m_erased; }
  std::size_t resets() const noexcept { return m_resets; }

private:
  static constexpr std::uint32_t page_size = 4096;
  using Page = std::array<std::uint8_t, page_size>;

  rt73::Frame dispatch(const rt73::Frame &request);
  rt73::Frame ack(const rt73::Frame &request, byte_vector payload = {}) const;
  rt73::Frame nak(const rt73::Frame &request, std::uint8_t code) const;

  rt73::Frame on_read(const rt73::Frame &request);
  rt73::Frame on_write(const rt73::Frame &request);
  rt73::Frame on_erase(const rt73::Frame &request);
  rt73::Frame on_program(const rt73::Frame &request);
  rt73::Frame on_verify(const rt73::Frame &request);

  rt73::ProtocolProfile m_profile;
  std::string m_ident;
  std::map<std::uint32_t, Page> m_pages;

  std::size_t m_drop{};
  std::size_t m_corrupt{};
  std::set<std::uint32_t> m_bad_cells;
  std::optional<std::size_t> m_fail_chunk;

  std::vector<rt73::Frame> m_requests;

  // firmware programming state
  bool m_erased{};
  std::size_t m_expected_chunks{};
  std::size_t m_next_chunk{};
  std::vector<std::size_t> m_programmed;
  byte_vector m_firmware;
  std::size_t m_resets{};
};
