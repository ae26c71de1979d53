// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <FirmwareFlasher.hpp>
#include <utils.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rt73 {

void FirmwareFlasher::enter(FlashState state) {
  spdlog::info("Flasher {} -> {}", flash_state_to_string(m_state),
               flash_state_to_string(state));
  m_state = state;
}

template <typename F>
void FirmwareFlasher::step(std::optional<std::size_t> chunk, F &&f) {
  try {
    f();
  } catch (const TransportError &e) {
    throw FlashError(
        chunk ? fmt::format("Flashing failed in {} at chunk {}: {}",
                            flash_state_to_string(m_state), *chunk, e.what())
              : fmt::format("Flashing failed in {}: {}",
                            flash_state_to_string(m_state), e.what()),
        m_state, chunk);
  }
}

void FirmwareFlasher::erase(const FirmwareImage &image) {
  byte_vector payload;
  append_le(payload, static_cast<std::uint32_t>(image.chunk_count()));
  append_le(payload, image.size());
  m_link.send_command(m_link.profile().opcodes.erase, 0, payload);
}

void FirmwareFlasher::program(const FirmwareImage &image, std::size_t idx) {
  spdlog::debug("Programming chunk {} at 0x{:08x}", idx,
                image.chunk_address(idx));
  m_link.send_command(m_link.profile().opcodes.program,
                      image.chunk_address(idx), image.chunk(idx));
}

void FirmwareFlasher::verify(const FirmwareImage &image, std::size_t idx) {
  const auto &profile = m_link.profile();
  byte_vector payload;
  append_le(payload, static_cast<std::uint16_t>(image.chunk_size()));
  const auto reply = m_link.send_command(profile.opcodes.verify,
                                         image.chunk_address(idx), payload);
  const auto expected = image.chunk_checksum(profile.checksum, idx);
  if (reply.size() != 2 || range_cast<std::uint16_t>(reply) != expected) {
    throw FlashError(
        fmt::format("Chunk {} verification failed, expected checksum "
                    "0x{:04x}",
                    idx, expected),
        m_state, idx);
  }
  spdlog::debug("Chunk {} verified", idx);
}

void FirmwareFlasher::finalize() {
  m_link.send_command(m_link.profile().opcodes.reset, 0, {});
}

void FirmwareFlasher::flash(const FirmwareImage &image, OptListener listener) {
  if (image.chunk_size() > m_link.profile().max_payload) {
    throw FlashError(fmt::format("Chunks of {} bytes exceed the {} byte frame "
                                 "payload",
                                 image.chunk_size(),
                                 m_link.profile().max_payload),
                     m_state);
  }
  auto back_to_idle = finally{[this] {
    if (m_state != FlashState::IDLE) {
      enter(FlashState::IDLE);
    }
  }};
  const auto chunks = image.chunk_count();
  spdlog::info("Flashing {} bytes in {} chunks", image.size(), chunks);

  enter(FlashState::ERASING);
  step(std::nullopt, [&] { erase(image); });

  enter(FlashState::PROGRAMMING);
  for (std::size_t idx = 0; idx < chunks; ++idx) {
    step(idx, [&] { program(image, idx); });
    listener.onProgress("program"sv, idx + 1, chunks);
  }

  enter(FlashState::VERIFYING);
  for (std::size_t idx = 0; idx < chunks; ++idx) {
    step(idx, [&] { verify(image, idx); });
    listener.onProgress("verify"sv, idx + 1, chunks);
  }

  enter(FlashState::FINALIZING);
  step(std::nullopt, [this] { finalize(); });
  spdlog::info("Firmware flashed");
}

} // namespace rt73
