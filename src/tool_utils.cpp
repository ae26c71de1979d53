// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "tool_utils.hpp"

#include <BulkTable.hpp>
#include <Codec.hpp>
#include <Errors.hpp>
#include <FirmwareFlasher.hpp>
#include <FirmwareImage.hpp>
#include <Framer.hpp>
#include <ISerialPort.hpp>
#include <RT73.hpp>
#include <RecordJson.hpp>
#include <utils.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>

std::unique_ptr<AugmentedParser> get_parser() {
  std::unique_ptr<AugmentedParser> parser(new AugmentedParser{
      argparse::ArgumentParser{"rt73prog", RT73PROG_VER,
                               argparse::default_arguments::all},
      0});

  auto *program = &parser->parser;
  program->add_argument("action")
      .help("download, upload, download-bin, upload-bin, decompile, compile, "
            "dump, flash-fw, upload-hamcontacts or upload-hamgroups")
      .nargs(argparse::nargs_pattern::optional);
  program->add_argument("file")
      .help("codeplug (JSON or binary), firmware or CSV file the action "
            "works on")
      .nargs(argparse::nargs_pattern::optional);

  program->add_argument("-o", "--output")
      .help("output file of decompile/compile, defaults to the input file "
            "with a .json/.bin extension");
  program->add_argument("-D", "--device")
      .help("serial device of the radio")
      .default_value(std::string{"/dev/ttyUSB0"});
  program->add_argument("-b", "--baud")
      .help("baud rate, overrides the protocol profile")
      .scan<'u', std::uint32_t>();
  program->add_argument("-c", "--config")
      .help("protocol profile (JSON), built-in defaults are used otherwise");
  program->add_argument("--contact-bytes")
      .help("ham contact record size, 16 or 128 bytes")
      .default_value(std::uint32_t{16})
      .scan<'u', std::uint32_t>();
  program->add_argument("--headers")
      .help("dumps the codeplug region layout, then exits")
      .flag();
  program->add_argument("-q", "--quiet")
      .help("quiet mode, only errors are reported")
      .flag();
  program->add_argument("-V", "--verbose")
      .action([verbose = std::addressof(parser->verbosity)](const auto &) {
        *verbose += 1;
      })
      .append()
      .nargs(0)
      .help("print more information about the operation")
      .default_value(false)
      .implicit_value(true);
  return parser;
}

void StreamProgress::onProgress(std::string_view what, std::size_t done,
                                std::size_t total) {
  os << fmt::format("\r{}: {}/{}", what, done, total);
  if (done == total) {
    os << '\n';
  }
  os.flush();
}

ToolContext tool_context(const argparse::ArgumentParser &parser) {
  ToolContext ctx{};
  ctx.device = parser.get<std::string>("--device");
  if (const auto config = parser.present("--config")) {
    ctx.profile = rt73::load_profile(fs::path{*config});
    spdlog::debug("Loaded protocol profile {}", *config);
  }
  if (const auto baud = parser.present<std::uint32_t>("--baud")) {
    ctx.profile.baud = *baud;
  }
  ctx.contact_bytes = parser.get<std::uint32_t>("--contact-bytes");
  if (const auto file = parser.present("file")) {
    ctx.file = *file;
  }
  if (const auto output = parser.present("--output")) {
    ctx.output = *output;
  }
  ctx.quiet = parser["--quiet"] == true;
  return ctx;
}

void print_headers(std::ostream &os, const Layout::MemoryMap &map) {
  os << fmt::format("Memory map {} at 0x{:08x}, {} bytes:\n", map.name(),
                    map.base_address(), map.total_size());
  for (const auto &region : map.regions()) {
    os << region << '\n';
  }
}

namespace {

fs::path output_path(const ToolContext &ctx, std::string_view extension) {
  if (!ctx.output.empty()) {
    return ctx.output;
  }
  return fs::path{ctx.file}.replace_extension(extension);
}

// Owns the link to the radio for the duration of one action
struct Radio {
  explicit Radio(const ToolContext &ctx)
      : framer{ISerialPort::Create(ctx.device, ctx.profile.baud), ctx.profile},
        progress{std::cerr}, listener{ctx.quiet ? nullptr : &progress} {
    spdlog::info("Talking to the radio through {}", framer.port().describe());
  }

  ~Radio() {
    const auto &stats = framer.stats();
    spdlog::debug("{} frames sent, {} retries, {} timeouts, {} corrupt "
                  "replies",
                  stats.frames_sent, stats.retries, stats.timeouts,
                  stats.corrupt_responses);
  }

  rt73::Framer framer;
  StreamProgress progress;
  OptListener listener;
};

} // namespace

void execDownload(const ToolContext &ctx, bool binary) {
  Radio radio{ctx};
  rt73::DeviceSession session{rt73map::codeplug_map(), radio.framer};
  const auto guard = session.connect();
  const auto image = session.download(radio.listener);
  if (binary) {
    rt73::write_image(ctx.file, image);
  } else {
    const rt73::Codec codec{session.map()};
    rt73::write_records(ctx.file, codec.decode(image), codec.map());
  }
  spdlog::info("Codeplug saved to {}", ctx.file.string());
}

void execUpload(const ToolContext &ctx, bool binary) {
  const rt73::Codec codec{rt73map::codeplug_map()};
  const auto image =
      binary ? rt73::read_image(ctx.file)
             : codec.encode(rt73::read_records(ctx.file, codec.map()));
  if (binary) {
    // refuse images that would not decode
    (void)codec.decode(image);
  }
  Radio radio{ctx};
  rt73::DeviceSession session{codec.map(), radio.framer};
  const auto guard = session.connect();
  session.upload(image, radio.listener);
  spdlog::info("Codeplug uploaded from {}", ctx.file.string());
}

void execDecompile(const ToolContext &ctx) {
  const rt73::Codec codec{rt73map::codeplug_map()};
  const auto out = output_path(ctx, ".json");
  rt73::write_records(out, codec.decode(rt73::read_image(ctx.file)),
                      codec.map());
  spdlog::info("Decompiled {} into {}", ctx.file.string(), out.string());
}

void execCompile(const ToolContext &ctx) {
  const rt73::Codec codec{rt73map::codeplug_map()};
  const auto out = output_path(ctx, ".bin");
  rt73::write_image(out,
                    codec.encode(rt73::read_records(ctx.file, codec.map())));
  spdlog::info("Compiled {} into {}", ctx.file.string(), out.string());
}

void execDump(const ToolContext &ctx) {
  const auto map = rt73map::codeplug_map();
  const auto image = rt73::read_image(ctx.file);
  if (image.size() != map.total_size()) {
    throw rt73::DecodeError(
        fmt::format("{} holds {} bytes, a codeplug image has {}",
                    ctx.file.string(), image.size(), map.total_size()),
        map.name(), static_cast<std::uint32_t>(image.size()));
  }
  OstreamDumper dumper(std::cout);
  dumper.dump_start();
  for (const auto &region : map.regions()) {
    dumper.dump_region(region, map.base_address(),
                       std::span{image}.subspan(region.start, region.length));
  }
  dumper.dump_end();
}

void execFlash(const ToolContext &ctx) {
  const auto image =
      rt73::FirmwareImage::from_file(ctx.file, ctx.profile.max_payload);
  Radio radio{ctx};
  rt73::FirmwareFlasher flasher{radio.framer};
  flasher.flash(image, radio.listener);
}

namespace {

void upload_table(const ToolContext &ctx, const Layout::MemoryMap &map,
                  const std::vector<rt73::BulkEntry> &entries) {
  const rt73::BulkTable table{map};
  const auto bytes = table.encode(entries);
  Radio radio{ctx};
  rt73::DeviceSession session{map, radio.framer};
  const auto guard = session.connect();
  session.upload_table(map, bytes, radio.listener);
  spdlog::info("Uploaded {} entries into {}", entries.size(), map.name());
}

std::ifstream open_csv(const fs::path &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw rt73::Error(fmt::format("Can't open {}", path.string()));
  }
  return ifs;
}

} // namespace

void execUploadHamContacts(const ToolContext &ctx) {
  const auto map = rt73map::contact_db_map(ctx.contact_bytes);
  auto csv = open_csv(ctx.file);
  upload_table(ctx, map,
               rt73::read_contacts_csv(
                   csv, rt73::BulkTable{map}.text_capacity()));
}

void execUploadHamGroups(const ToolContext &ctx) {
  const auto map = rt73map::group_db_map();
  auto csv = open_csv(ctx.file);
  upload_table(ctx, map,
               rt73::read_groups_csv(csv,
                                     rt73::BulkTable{map}.text_capacity()));
}
