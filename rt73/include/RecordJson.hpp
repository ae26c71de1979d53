// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <RecordSet.hpp>
#include <Region.hpp>
#include <fwd.hpp>

#include <filesystem>
#include <iosfwd>
#include <span>
#include <string>

namespace rt73 {

// {"<region>": [{"slot": n, "<field>": value, ..., "reserved": "<hex>"}]}
// with the regions in layout order
std::string records_to_json(const RecordSet &records,
                            const Layout::MemoryMap &map);

// Regions missing from the document are blank, unknown regions and
// malformed records raise EncodeError
RecordSet records_from_json(std::istream &is, const Layout::MemoryMap &map);

void write_records(const std::filesystem::path &path, const RecordSet &records,
                   const Layout::MemoryMap &map);
RecordSet read_records(const std::filesystem::path &path,
                       const Layout::MemoryMap &map);

// raw binary codeplug files
byte_vector read_image(const std::filesystem::path &path);
void write_image(const std::filesystem::path &path,
                 std::span<const std::uint8_t> data);

} // namespace rt73
