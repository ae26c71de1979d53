// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <range/v3/algorithm/copy.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/fill.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/chunk.hpp>
#include <range/v3/view/enumerate.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace rg = ranges;
namespace rgv = rg::views;

using std::literals::string_literals::operator""s;
using std::literals::string_view_literals::operator""sv;

inline constexpr auto operator""_b(unsigned long long val) {
  return std::uint8_t(val);
}

using byte_vector = std::vector<std::uint8_t>;

template <std::invocable F> struct [[nodiscard]] finally : F {
  constexpr explicit finally(F f) : F{std::move(f)} {}
  constexpr ~finally() { (*static_cast<F *>(this))(); }
};
