// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Errors.hpp>
#include <Protocol.hpp>
#include <fwd.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace rt73 {

namespace {

template <typename T>
T bounded(const json &j, std::string_view key, T current, T min,
          T max = std::numeric_limits<T>::max()) {
  const auto it = j.find(std::string{key});
  if (it == j.end()) {
    return current;
  }
  if (!it->is_number_unsigned()) {
    throw Error(fmt::format("Profile key '{}' must be a non-negative integer",
                            key));
  }
  const auto val = it->get<std::uint64_t>();
  if (val < min || val > max) {
    throw Error(fmt::format("Profile key '{}' = {} is out of range [{}, {}]",
                            key, val, min, max));
  }
  return static_cast<T>(val);
}

bool flag(const json &j, std::string_view key, bool current) {
  const auto it = j.find(std::string{key});
  if (it == j.end()) {
    return current;
  }
  if (!it->is_boolean()) {
    throw Error(fmt::format("Profile key '{}' must be a boolean", key));
  }
  return it->get<bool>();
}

Opcodes parse_opcodes(const json &j, Opcodes ops) {
  const auto byte = [&j](std::string_view key, std::uint8_t current) {
    return bounded<std::uint8_t>(j, key, current, 0);
  };
  ops.hello = byte("hello", ops.hello);
  ops.read = byte("read", ops.read);
  ops.write = byte("write", ops.write);
  ops.erase = byte("erase", ops.erase);
  ops.program = byte("program", ops.program);
  ops.verify = byte("verify", ops.verify);
  ops.reset = byte("reset", ops.reset);
  ops.ack_flag = byte("ack_flag", ops.ack_flag);
  ops.nak = byte("nak", ops.nak);
  if (ops.ack_flag == 0) {
    throw Error("Profile opcode 'ack_flag' must not be zero");
  }
  return ops;
}

} // namespace

ProtocolProfile load_profile(std::istream &is) {
  json j;
  try {
    j = json::parse(is);
  } catch (const json::parse_error &e) {
    throw Error(fmt::format("Invalid protocol profile: {}", e.what()));
  }
  if (!j.is_object()) {
    throw Error("Protocol profile must be a JSON object");
  }
  ProtocolProfile profile{};
  if (const auto it = j.find("version"); it != j.end()) {
    if (!it->is_string()) {
      throw Error("Profile key 'version' must be a string");
    }
    profile.version = it->get<std::string>();
  }
  if (const auto it = j.find("checksum"); it != j.end()) {
    if (!it->is_string()) {
      throw Error("Profile key 'checksum' must be a string");
    }
    profile.checksum = string_to_checksum(it->get<std::string>());
  }
  profile.max_payload =
      bounded<std::uint16_t>(j, "max_payload", profile.max_payload, 1);
  profile.attempts = bounded<unsigned>(j, "attempts", profile.attempts, 1, 100);
  profile.timeout = std::chrono::milliseconds{bounded<std::uint32_t>(
      j, "timeout_ms", static_cast<std::uint32_t>(profile.timeout.count()),
      1)};
  profile.readback_verify =
      flag(j, "readback_verify", profile.readback_verify);
  profile.record_atomic_writes =
      flag(j, "record_atomic_writes", profile.record_atomic_writes);
  profile.max_region_write = bounded<std::uint32_t>(
      j, "max_region_write", profile.max_region_write, 1);
  profile.baud = bounded<std::uint32_t>(j, "baud", profile.baud, 1);
  if (const auto it = j.find("opcodes"); it != j.end()) {
    if (!it->is_object()) {
      throw Error("Profile key 'opcodes' must be an object");
    }
    profile.opcodes = parse_opcodes(*it, profile.opcodes);
  }
  return profile;
}

ProtocolProfile load_profile(const std::filesystem::path &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw Error(fmt::format("Can't open protocol profile {}", path.string()));
  }
  return load_profile(ifs);
}

std::string dump_profile(const ProtocolProfile &profile) {
  const auto &ops = profile.opcodes;
  const json j = {
      {"version", profile.version},
      {"checksum", std::string{checksum_to_string(profile.checksum)}},
      {"max_payload", profile.max_payload},
      {"attempts", profile.attempts},
      {"timeout_ms", profile.timeout.count()},
      {"readback_verify", profile.readback_verify},
      {"record_atomic_writes", profile.record_atomic_writes},
      {"max_region_write", profile.max_region_write},
      {"baud", profile.baud},
      {"opcodes",
       {{"hello", ops.hello},
        {"read", ops.read},
        {"write", ops.write},
        {"erase", ops.erase},
        {"program", ops.program},
        {"verify", ops.verify},
        {"reset", ops.reset},
        {"ack_flag", ops.ack_flag},
        {"nak", ops.nak}}}};
  return j.dump(2);
}

} // namespace rt73
