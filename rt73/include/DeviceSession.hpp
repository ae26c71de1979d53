// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ILink.hpp>
#include <Region.hpp>
#include <fwd.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace rt73 {

enum class SessionState { DISCONNECTED, CONNECTED, DOWNLOADING, UPLOADING };

constexpr std::string_view session_state_to_string(SessionState s) noexcept {
  switch (s) {
  case SessionState::DISCONNECTED:
    return "DISCONNECTED"sv;
  case SessionState::CONNECTED:
    return "CONNECTED"sv;
  case SessionState::DOWNLOADING:
    return "DOWNLOADING"sv;
  case SessionState::UPLOADING:
    return "UPLOADING"sv;
  }
  return "UNKNOWN"sv;
}

// Whole-image transfers of one memory map over a link.
// A transport failure, cancellation or a failed read-back verification
// drops the session to DISCONNECTED, there is no implicit reconnect.
class DeviceSession {
public:
  struct [[nodiscard]] Disconnect {
    explicit Disconnect(DeviceSession &session) : m_session{&session} {}
    Disconnect(const Disconnect &) = delete;
    Disconnect &operator=(const Disconnect &) = delete;
    Disconnect(Disconnect &&other) noexcept
        : m_session{std::exchange(other.m_session, nullptr)} {}
    Disconnect &operator=(Disconnect &&other) = delete;

    ~Disconnect() {
      if (m_session)
        m_session->disconnect();
    }
    auto &session() const { return *m_session; }

  private:
    DeviceSession *m_session;
  };

  DeviceSession(Layout::MemoryMap map, ILink &link);

  // HELLO handshake, the guard disconnects when it goes out of scope
  Disconnect connect();
  void disconnect() noexcept;

  byte_vector download(OptListener listener = {});
  // throws EncodeError when the image does not span the map
  void upload(std::span<const std::uint8_t> image, OptListener listener = {});

  // Bulk tables: a "header" region holding the entry count followed by an
  // "entries" region of which only the used prefix is transferred
  byte_vector download_table(const Layout::MemoryMap &table,
                             OptListener listener = {});
  void upload_table(const Layout::MemoryMap &table,
                    std::span<const std::uint8_t> bytes,
                    OptListener listener = {});

  SessionState state() const noexcept { return m_state; }
  const std::string &ident() const noexcept { return m_ident; }
  const Layout::MemoryMap &map() const noexcept { return m_map; }

private:
  template <typename F> decltype(auto) transfer(SessionState during, F &&f);

  byte_vector read_region(const Layout::MemoryMap &map,
                          const Layout::RegionDescriptor &region,
                          std::uint32_t length, OptListener &listener);
  void write_region(const Layout::MemoryMap &map,
                    const Layout::RegionDescriptor &region,
                    std::span<const std::uint8_t> data,
                    OptListener &listener);
  std::uint32_t write_chunk_size(const Layout::RegionDescriptor &region) const;

  Layout::MemoryMap m_map;
  ILink &m_link;
  SessionState m_state{SessionState::DISCONNECTED};
  std::string m_ident;
};

} // namespace rt73
