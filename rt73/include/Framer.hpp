// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Frame.hpp>
#include <ILink.hpp>
#include <ISerialPort.hpp>
#include <Protocol.hpp>

#include <cstddef>
#include <optional>

namespace rt73 {

class Framer : public ILink {
public:
  struct Stats {
    std::size_t frames_sent{};
    std::size_t retries{};
    std::size_t timeouts{};
    std::size_t corrupt_responses{};
  };

  explicit Framer(ISerialPort::Ptr port, ProtocolProfile profile = {});

  byte_vector send_command(std::uint8_t opcode, std::uint32_t address,
                           std::span<const std::uint8_t> payload) override;
  byte_vector read_region(std::uint32_t address,
                          std::uint32_t length) override;
  void write_region(std::uint32_t address, std::span<const std::uint8_t> data,
                    std::uint32_t align = 1) override;

  const ProtocolProfile &profile() const noexcept override { return m_profile; }
  const Stats &stats() const noexcept { return m_stats; }
  ISerialPort &port() const noexcept { return *m_port; }

private:
  // Sends the request until a valid reply arrives or the attempts run out
  Frame transact(const Frame &request,
                 std::optional<std::size_t> expected_payload = {});
  // nullopt on timeout, throws ProtocolError on a malformed frame
  std::optional<Frame> receive();
  std::uint32_t write_chunk_size(std::uint32_t align) const;

  ISerialPort::Ptr m_port;
  ProtocolProfile m_profile;
  Stats m_stats{};
};

} // namespace rt73
