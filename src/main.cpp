// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <iostream>
#include <ostream>

#include "tool_utils.hpp"

#include <Errors.hpp>
#include <ISerialPort.hpp>
#include <RT73.hpp>

#include <argparse/argparse.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

enum ExitCode : int {
  OK = 0,
  NO_RESPONSE = 1,
  UNEXPECTED_RESPONSE = 2,
  LAYOUT = 3,
  DATA = 4,
  FLASH = 5,
  ARGUMENTS = 6,
  VERIFICATION = 7,
  INTERRUPTED = 130,
  OTHER = -1,
};

int usage_error(const argparse::ArgumentParser &parser, std::string_view msg) {
  std::cerr << "ERROR:" << msg << '\n' << parser;
  return ARGUMENTS;
}

} // namespace

int main(int argc, char *argv[]) try {
  auto pparser = get_parser();
  auto &aug_parser = *pparser;
  auto &parser = aug_parser.parser;
  try {
    parser.parse_args(argc, argv);
  } catch (const std::exception &e) {
    return usage_error(parser, e.what());
  }
  spdlog::set_level(
      log_level(verbosity(aug_parser.verbosity, parser["--quiet"] == true)));

  if (parser["--headers"] == true) {
    print_headers(std::cout, rt73map::codeplug_map());
    print_headers(std::cout, rt73map::contact_db_map());
    print_headers(std::cout, rt73map::group_db_map());
    return OK;
  }
  const auto action = parser.present("action");
  if (!action || !parser.present("file")) {
    return usage_error(parser, "an action and a file are required");
  }
  const auto ctx = tool_context(parser);
  ISerialPort::install_signal_handlers();

  if (*action == "download") {
    execDownload(ctx, false);
  } else if (*action == "upload") {
    execUpload(ctx, false);
  } else if (*action == "download-bin") {
    execDownload(ctx, true);
  } else if (*action == "upload-bin") {
    execUpload(ctx, true);
  } else if (*action == "decompile") {
    execDecompile(ctx);
  } else if (*action == "compile") {
    execCompile(ctx);
  } else if (*action == "dump") {
    execDump(ctx);
  } else if (*action == "flash-fw") {
    execFlash(ctx);
  } else if (*action == "upload-hamcontacts") {
    execUploadHamContacts(ctx);
  } else if (*action == "upload-hamgroups") {
    execUploadHamGroups(ctx);
  } else {
    return usage_error(parser, fmt::format("unknown action '{}'", *action));
  }
  return OK;
} catch (ISerialPort::Interrupted const &e) {
  std::cerr << e.what() << '\n';
  return INTERRUPTED;
} catch (const rt73::VerificationError &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return VERIFICATION;
} catch (const rt73::FlashError &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return FLASH;
} catch (const rt73::ProtocolError &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return UNEXPECTED_RESPONSE;
} catch (const rt73::TransportError &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return NO_RESPONSE;
} catch (const rt73::LayoutError &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return LAYOUT;
} catch (const rt73::DecodeError &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return DATA;
} catch (const rt73::EncodeError &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return DATA;
} catch (const std::exception &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return OTHER;
}
