// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Protocol.hpp>
#include <fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

struct IProgressListener {
  virtual void onProgress(std::string_view what, std::size_t done,
                          std::size_t total) = 0;

protected:
  ~IProgressListener() = default;
};

struct OptListener {
  OptListener(IProgressListener *listener = nullptr) : listener{listener} {}
  void onProgress(std::string_view what, std::size_t done, std::size_t total) {
    if (listener)
      listener->onProgress(what, done, total);
  }

private:
  IProgressListener *listener{};
};

namespace rt73 {

// Request/response access to the device memory
struct ILink {
  virtual byte_vector send_command(std::uint8_t opcode, std::uint32_t address,
                                   std::span<const std::uint8_t> payload) = 0;
  virtual byte_vector read_region(std::uint32_t address,
                                  std::uint32_t length) = 0;
  // frames never split an `align` sized record when the profile asks for
  // record atomic writes
  virtual void write_region(std::uint32_t address,
                            std::span<const std::uint8_t> data,
                            std::uint32_t align = 1) = 0;
  virtual const ProtocolProfile &profile() const noexcept = 0;

  virtual ~ILink() = default;
};

} // namespace rt73
