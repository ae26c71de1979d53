// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceSession.hpp>
#include <ILink.hpp>
#include <Protocol.hpp>
#include <Region.hpp>

#include <argparse/argparse.hpp>
#include <spdlog/common.h>

#include <algorithm>
#include <concepts>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

enum class Verbosity { QUIET = 0, WARN = 1, INFO = 2, DEBUG = 3, TRACE = 4,
                       MAX = TRACE };

template <std::integral T> Verbosity verbosity(T val, bool quiet) {
  if (quiet) {
    return Verbosity::QUIET;
  }
  return static_cast<Verbosity>(std::clamp(
      val + 1, static_cast<T>(Verbosity::WARN), static_cast<T>(Verbosity::MAX)));
}

constexpr spdlog::level::level_enum log_level(Verbosity v) noexcept {
  switch (v) {
  case Verbosity::QUIET:
    return spdlog::level::err;
  case Verbosity::WARN:
    return spdlog::level::warn;
  case Verbosity::INFO:
    return spdlog::level::info;
  case Verbosity::DEBUG:
    return spdlog::level::debug;
  case Verbosity::TRACE:
    return spdlog::level::trace;
  }
  return spdlog::level::warn;
}

namespace fs = std::filesystem;

struct AugmentedParser {
  argparse::ArgumentParser parser;
  int verbosity = 0;
};

std::unique_ptr<AugmentedParser> get_parser();

// Prints per transfer progress lines to a stream
class StreamProgress : public IProgressListener {
public:
  explicit StreamProgress(std::ostream &os) : os{os} {}
  void onProgress(std::string_view what, std::size_t done,
                  std::size_t total) override;

private:
  std::ostream &os;
};

// Everything an action needs to talk to the radio
struct ToolContext {
  std::string device;
  rt73::ProtocolProfile profile;
  std::uint32_t contact_bytes{16};
  fs::path file;
  fs::path output;
  bool quiet{};
};

ToolContext tool_context(const argparse::ArgumentParser &parser);

void print_headers(std::ostream &os, const Layout::MemoryMap &map);

void execDownload(const ToolContext &ctx, bool binary);
void execUpload(const ToolContext &ctx, bool binary);
void execDecompile(const ToolContext &ctx);
void execCompile(const ToolContext &ctx);
void execDump(const ToolContext &ctx);
void execFlash(const ToolContext &ctx);
void execUploadHamContacts(const ToolContext &ctx);
void execUploadHamGroups(const ToolContext &ctx);
