// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rt73 {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The link did not deliver a complete response in time
struct TransportError : Error {
  using Error::Error;
};

// A response arrived but could not be trusted (checksum, length, opcode)
struct ProtocolError : TransportError {
  using TransportError::TransportError;
};

// The device explicitly rejected a request
struct DeviceError : ProtocolError {
  DeviceError(const std::string &msg, std::uint8_t code)
      : ProtocolError{msg}, code{code} {}
  std::uint8_t code{};
};

struct LayoutError : Error {
  using Error::Error;
};

struct NotFoundError : Error {
  using Error::Error;
};

struct DecodeError : Error {
  DecodeError(const std::string &msg, std::string_view region,
              std::uint32_t offset)
      : Error{msg}, region{region}, offset{offset} {}
  std::string region;
  // byte offset within the image
  std::uint32_t offset{};
};

struct EncodeError : Error {
  EncodeError(const std::string &msg, std::string_view region,
              std::optional<std::uint32_t> slot = {},
              std::string_view field = {})
      : Error{msg}, region{region}, slot{slot}, field{field} {}
  std::string region;
  std::optional<std::uint32_t> slot;
  std::string field;
};

struct VerificationError : Error {
  VerificationError(const std::string &msg, std::string_view region,
                    std::uint32_t offset)
      : Error{msg}, region{region}, offset{offset} {}
  std::string region;
  // byte offset within the region
  std::uint32_t offset{};
};

enum class FlashState { IDLE, ERASING, PROGRAMMING, VERIFYING, FINALIZING };

constexpr std::string_view flash_state_to_string(FlashState s) noexcept {
  using std::literals::operator""sv;
  switch (s) {
  case FlashState::IDLE:
    return "IDLE"sv;
  case FlashState::ERASING:
    return "ERASING"sv;
  case FlashState::PROGRAMMING:
    return "PROGRAMMING"sv;
  case FlashState::VERIFYING:
    return "VERIFYING"sv;
  case FlashState::FINALIZING:
    return "FINALIZING"sv;
  }
  return "UNKNOWN"sv;
}

struct FlashError : Error {
  FlashError(const std::string &msg, FlashState state,
             std::optional<std::size_t> chunk_index = {})
      : Error{msg}, state{state}, chunk_index{chunk_index} {}
  FlashState state{};
  std::optional<std::size_t> chunk_index;
};

struct SessionStateError : Error {
  using Error::Error;
};

} // namespace rt73
