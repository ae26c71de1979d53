// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Errors.hpp>
#include <RecordJson.hpp>
#include <fwd.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>

using ordered_json = nlohmann::ordered_json;

namespace rt73 {

namespace {

constexpr std::string_view hex_digits = "0123456789abcdef";

std::string to_hex(const byte_vector &bytes) {
  std::string res;
  res.reserve(bytes.size() * 2);
  for (const auto b : bytes) {
    res.push_back(hex_digits[b >> 4]);
    res.push_back(hex_digits[b & 0x0F]);
  }
  return res;
}

struct JsonValue {
  ordered_json operator()(std::monostate) const { return nullptr; }
  ordered_json operator()(bool v) const { return v; }
  ordered_json operator()(std::int64_t v) const { return v; }
  ordered_json operator()(const std::string &v) const { return v; }
  ordered_json operator()(const SlotList &v) const {
    auto arr = ordered_json::array();
    for (const auto &e : v) {
      arr.push_back(e ? ordered_json(*e) : ordered_json(nullptr));
    }
    return arr;
  }
};

class RecordParser {
public:
  RecordParser(std::string_view region, std::uint32_t index)
      : m_region{region}, m_index{index} {}

  Record parse(const ordered_json &j) const {
    if (!j.is_object()) {
      fail("record must be an object");
    }
    const auto slot = j.find("slot");
    if (slot == j.end() || !slot->is_number_unsigned() ||
        slot->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
      fail("record needs a non-negative integer 'slot'");
    }
    Record record{slot->get<std::uint32_t>(), {}, {}};
    for (const auto &item : j.items()) {
      const auto &key = item.key();
      if (key == "slot") {
        continue;
      }
      if (key == "reserved") {
        record.reserved = reserved(item.value());
        continue;
      }
      record.fields.emplace(key, value(key, item.value()));
    }
    return record;
  }

private:
  [[noreturn]] void fail(std::string_view msg,
                         std::string_view field = {}) const {
    throw EncodeError(fmt::format("{} record #{}{}{}: {}", m_region, m_index,
                                  field.empty() ? "" : ".", field, msg),
                      m_region, std::nullopt, field);
  }

  std::uint32_t slot_index(const ordered_json &j, std::string_view key) const {
    if (!j.is_number_unsigned() ||
        j.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
      fail("slot lists hold non-negative integers or null", key);
    }
    return j.get<std::uint32_t>();
  }

  FieldValue value(std::string_view key, const ordered_json &j) const {
    switch (j.type()) {
    case ordered_json::value_t::null:
      return std::monostate{};
    case ordered_json::value_t::boolean:
      return j.get<bool>();
    case ordered_json::value_t::number_integer:
      return j.get<std::int64_t>();
    case ordered_json::value_t::number_unsigned:
      if (j.get<std::uint64_t>() >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        fail("integer out of range", key);
      }
      return j.get<std::int64_t>();
    case ordered_json::value_t::string:
      return j.get<std::string>();
    case ordered_json::value_t::array: {
      SlotList list;
      for (const auto &e : j) {
        list.push_back(e.is_null() ? std::nullopt
                                   : std::optional{slot_index(e, key)});
      }
      return list;
    }
    default:
      fail(fmt::format("unsupported JSON type {}", j.type_name()), key);
    }
  }

  byte_vector reserved(const ordered_json &j) const {
    if (!j.is_string()) {
      fail("must be a hex string", "reserved");
    }
    const auto &text = j.get_ref<const std::string &>();
    if (text.size() % 2 != 0) {
      fail("hex string of odd length", "reserved");
    }
    byte_vector res;
    res.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
      const auto hi = hex_digits.find(static_cast<char>(
          std::tolower(static_cast<unsigned char>(text[i]))));
      const auto lo = hex_digits.find(static_cast<char>(
          std::tolower(static_cast<unsigned char>(text[i + 1]))));
      if (hi == std::string_view::npos || lo == std::string_view::npos) {
        fail(fmt::format("invalid hex digits '{}'", text.substr(i, 2)),
             "reserved");
      }
      res.push_back(static_cast<std::uint8_t>(hi << 4 | lo));
    }
    return res;
  }

  std::string_view m_region;
  std::uint32_t m_index;
};

} // namespace

std::string records_to_json(const RecordSet &records,
                            const Layout::MemoryMap &map) {
  auto doc = ordered_json::object();
  for (const auto &region : map.regions()) {
    auto arr = ordered_json::array();
    if (const auto *r = records.find(region.name); r) {
      for (const auto &record : r->records) {
        ordered_json obj;
        obj["slot"] = record.slot;
        for (const auto &field : region.fields) {
          if (const auto it = record.fields.find(field.name);
              it != record.fields.end()) {
            obj[std::string{field.name}] = std::visit(JsonValue{}, it->second);
          }
        }
        if (!record.reserved.empty()) {
          obj["reserved"] = to_hex(record.reserved);
        }
        arr.push_back(std::move(obj));
      }
    }
    doc[std::string{region.name}] = std::move(arr);
  }
  return doc.dump(2);
}

RecordSet records_from_json(std::istream &is, const Layout::MemoryMap &map) {
  ordered_json doc;
  try {
    doc = ordered_json::parse(is);
  } catch (const ordered_json::parse_error &e) {
    throw EncodeError(fmt::format("Invalid record document: {}", e.what()),
                      map.name());
  }
  if (!doc.is_object()) {
    throw EncodeError("Record document must be a JSON object", map.name());
  }
  for (const auto &item : doc.items()) {
    const auto &key = item.key();
    if (!map.find(key)) {
      throw EncodeError(fmt::format("Unknown region '{}' in memory map '{}'",
                                    key, map.name()),
                        key);
    }
  }
  RecordSet result;
  for (const auto &region : map.regions()) {
    RegionRecords records{std::string{region.name}, {}};
    if (const auto it = doc.find(std::string{region.name}); it != doc.end()) {
      if (!it->is_array()) {
        throw EncodeError(
            fmt::format("Region '{}' must hold an array of records",
                        region.name),
            region.name);
      }
      std::uint32_t index = 0;
      for (const auto &j : *it) {
        records.records.push_back(RecordParser{region.name, index++}.parse(j));
      }
    }
    result.regions.push_back(std::move(records));
  }
  return result;
}

void write_records(const std::filesystem::path &path, const RecordSet &records,
                   const Layout::MemoryMap &map) {
  std::ofstream ofs(path);
  if (!ofs) {
    throw Error(fmt::format("Can't create {}", path.string()));
  }
  ofs << records_to_json(records, map) << '\n';
}

RecordSet read_records(const std::filesystem::path &path,
                       const Layout::MemoryMap &map) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw Error(fmt::format("Can't open {}", path.string()));
  }
  return records_from_json(ifs, map);
}

byte_vector read_image(const std::filesystem::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw Error(fmt::format("Can't open {}", path.string()));
  }
  return byte_vector{std::istreambuf_iterator<char>(ifs),
                     std::istreambuf_iterator<char>()};
}

void write_image(const std::filesystem::path &path,
                 std::span<const std::uint8_t> data) {
  std::ofstream ofs(path, std::ios::binary);
  if (!ofs) {
    throw Error(fmt::format("Can't create {}", path.string()));
  }
  rg::copy(data, std::ostreambuf_iterator<char>(ofs));
  if (!ofs.flush()) {
    throw Error(fmt::format("Can't write {}", path.string()));
  }
}

} // namespace rt73
