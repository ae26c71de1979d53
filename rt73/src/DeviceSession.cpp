// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Codec.hpp>
#include <DeviceSession.hpp>
#include <Errors.hpp>
#include <ISerialPort.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/mismatch.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace rt73 {

namespace {

// header with the entry count cleared
byte_vector empty_header(const Layout::MemoryMap &table,
                         std::span<const std::uint8_t> head) {
  const Codec codec{table};
  const auto &header = table.region_for("header"sv);
  auto records = codec.decode_region(header, head);
  byte_vector res(head.begin(), head.end());
  if (!records.empty()) {
    records.front().at("count") = std::int64_t{0};
    codec.encode_region(header, records, res);
  }
  return res;
}

} // namespace

DeviceSession::DeviceSession(Layout::MemoryMap map, ILink &link)
    : m_map{std::move(map)}, m_link{link} {}

auto DeviceSession::connect() -> Disconnect {
  if (m_state != SessionState::DISCONNECTED) {
    throw SessionStateError(fmt::format("Can't connect in state {}",
                                        session_state_to_string(m_state)));
  }
  const auto reply =
      m_link.send_command(m_link.profile().opcodes.hello, 0, {});
  m_ident.assign(reply.begin(), reply.end());
  m_state = SessionState::CONNECTED;
  spdlog::info("Connected to '{}' (profile {})", m_ident,
               m_link.profile().version);
  return Disconnect(*this);
}

void DeviceSession::disconnect() noexcept {
  if (m_state != SessionState::DISCONNECTED) {
    spdlog::debug("Disconnecting from '{}'", m_ident);
  }
  m_state = SessionState::DISCONNECTED;
}

template <typename F>
decltype(auto) DeviceSession::transfer(SessionState during, F &&f) {
  if (m_state != SessionState::CONNECTED) {
    throw SessionStateError(
        fmt::format("Can't start {} in state {}",
                    session_state_to_string(during),
                    session_state_to_string(m_state)));
  }
  m_state = during;
  auto done = finally{[this, during] {
    if (m_state == during) {
      m_state = SessionState::CONNECTED;
    }
  }};
  try {
    return f();
  } catch (const TransportError &e) {
    spdlog::error("Transfer aborted: {}", e.what());
    m_state = SessionState::DISCONNECTED;
    throw;
  } catch (const VerificationError &e) {
    spdlog::error("Transfer aborted: {}", e.what());
    m_state = SessionState::DISCONNECTED;
    throw;
  } catch (const ISerialPort::Interrupted &) {
    spdlog::warn("Transfer interrupted");
    m_state = SessionState::DISCONNECTED;
    throw;
  }
}

std::uint32_t
DeviceSession::write_chunk_size(const Layout::RegionDescriptor &region) const {
  const auto max = m_link.profile().max_region_write;
  const auto stride = std::max<std::uint32_t>(region.stride, 1);
  if (stride > max) {
    throw LayoutError(fmt::format(
        "Region '{}' records of {} bytes exceed the {} byte write limit",
        region.name, stride, max));
  }
  return max - max % stride;
}

byte_vector DeviceSession::read_region(const Layout::MemoryMap &map,
                                       const Layout::RegionDescriptor &region,
                                       std::uint32_t length,
                                       OptListener &listener) {
  spdlog::info("Reading {} bytes of {}.{} at 0x{:08x}", length, map.name(),
               region.name, map.address_of(region));
  auto data = m_link.read_region(map.address_of(region), length);
  if (data.size() != length) {
    throw ProtocolError(fmt::format("Region '{}' read {} bytes instead of {}",
                                    region.name, data.size(), length));
  }
  listener.onProgress(region.name, length, length);
  return data;
}

void DeviceSession::write_region(const Layout::MemoryMap &map,
                                 const Layout::RegionDescriptor &region,
                                 std::span<const std::uint8_t> data,
                                 OptListener &listener) {
  spdlog::info("Writing {} bytes of {}.{} at 0x{:08x}", data.size(),
               map.name(), region.name, map.address_of(region));
  const auto chunk = write_chunk_size(region);
  const auto &profile = m_link.profile();
  for (std::uint32_t offset = 0; offset < data.size();) {
    const auto count =
        std::min<std::uint32_t>(chunk, data.size() - offset);
    const auto part = data.subspan(offset, count);
    const auto address = map.address_of(region, offset);
    m_link.write_region(address, part, region.stride);
    if (profile.readback_verify) {
      const auto readback = m_link.read_region(address, count);
      const auto [w, r] = rg::mismatch(part, readback);
      if (w != part.end() || r != readback.end()) {
        const auto at = offset + static_cast<std::uint32_t>(w - part.begin());
        throw VerificationError(
            fmt::format("Read back of {}.{} differs at offset 0x{:x} "
                        "(address 0x{:08x})",
                        map.name(), region.name, at,
                        map.address_of(region, at)),
            region.name, at);
      }
    }
    offset += count;
    listener.onProgress(region.name, offset, data.size());
  }
}

byte_vector DeviceSession::download(OptListener listener) {
  return transfer(SessionState::DOWNLOADING, [&] {
    byte_vector image;
    image.reserve(m_map.total_size());
    for (const auto &region : m_map.regions()) {
      const auto data = read_region(m_map, region, region.length, listener);
      image.insert(image.end(), data.begin(), data.end());
    }
    if (image.size() != m_map.total_size()) {
      throw ProtocolError(fmt::format("Downloaded {} bytes instead of {}",
                                      image.size(), m_map.total_size()));
    }
    return image;
  });
}

void DeviceSession::upload(std::span<const std::uint8_t> image,
                           OptListener listener) {
  if (image.size() != m_map.total_size()) {
    throw EncodeError(fmt::format("Image of {} bytes does not match the {} "
                                  "bytes of memory map '{}'",
                                  image.size(), m_map.total_size(),
                                  m_map.name()),
                      m_map.name());
  }
  transfer(SessionState::UPLOADING, [&] {
    for (const auto &region : m_map.regions()) {
      write_region(m_map, region, image.subspan(region.start, region.length),
                   listener);
    }
  });
}

byte_vector DeviceSession::download_table(const Layout::MemoryMap &table,
                                          OptListener listener) {
  const auto &header = table.region_for("header"sv);
  const auto &entries = table.region_for("entries"sv);
  return transfer(SessionState::DOWNLOADING, [&] {
    auto bytes = read_region(table, header, header.length, listener);
    const auto records = Codec{table}.decode_region(header, bytes);
    const auto count =
        records.empty()
            ? std::int64_t{0}
            : std::get<std::int64_t>(records.front().at("count"sv));
    if (count < 0 || count > entries.slot_count()) {
      throw DecodeError(fmt::format("Table '{}' claims {} entries, capacity "
                                    "is {}",
                                    table.name(), count, entries.slot_count()),
                        header.name, header.start);
    }
    const auto used = static_cast<std::uint32_t>(count) * entries.stride;
    if (used > 0) {
      const auto data = read_region(table, entries, used, listener);
      bytes.insert(bytes.end(), data.begin(), data.end());
    }
    return bytes;
  });
}

void DeviceSession::upload_table(const Layout::MemoryMap &table,
                                 std::span<const std::uint8_t> bytes,
                                 OptListener listener) {
  const auto &header = table.region_for("header"sv);
  const auto &entries = table.region_for("entries"sv);
  if (bytes.size() < header.length || bytes.size() > table.total_size() ||
      (bytes.size() - header.length) % entries.stride != 0) {
    throw EncodeError(fmt::format("Table '{}' can't hold {} bytes",
                                  table.name(), bytes.size()),
                      table.name());
  }
  transfer(SessionState::UPLOADING, [&] {
    const auto head = bytes.first(header.length);
    const auto body = bytes.subspan(header.length);
    if (!body.empty()) {
      // the radio sees an empty table until every entry has landed
      write_region(table, header, empty_header(table, head), listener);
      write_region(table, entries, body, listener);
    }
    write_region(table, header, head, listener);
  });
}

} // namespace rt73
