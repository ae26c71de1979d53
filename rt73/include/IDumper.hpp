// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Region.hpp>

#include <cstdint>
#include <span>

struct IDumper {
  virtual void dump_start() = 0;
  virtual void dump_end() = 0;
  virtual void dump_region(const Layout::RegionDescriptor &region,
                           std::uint32_t base_address,
                           std::span<const std::uint8_t> data) = 0;

protected:
  ~IDumper() = default;
};
