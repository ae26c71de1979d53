// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Errors.hpp>
#include <FirmwareImage.hpp>
#include <ILink.hpp>

#include <cstddef>
#include <optional>

namespace rt73 {

// IDLE -> ERASING -> PROGRAMMING -> VERIFYING -> FINALIZING -> IDLE
// Any failure raises FlashError with the state and chunk it happened in and
// leaves the flasher IDLE. A partial flash is never resumed.
class FirmwareFlasher {
public:
  explicit FirmwareFlasher(ILink &link) : m_link{link} {}

  void flash(const FirmwareImage &image, OptListener listener = {});

  FlashState state() const noexcept { return m_state; }

private:
  void enter(FlashState state);
  void erase(const FirmwareImage &image);
  void program(const FirmwareImage &image, std::size_t idx);
  void verify(const FirmwareImage &image, std::size_t idx);
  void finalize();

  template <typename F>
  void step(std::optional<std::size_t> chunk, F &&f);

  ILink &m_link;
  FlashState m_state{FlashState::IDLE};
};

} // namespace rt73
