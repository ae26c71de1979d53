// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <BulkTable.hpp>
#include <Errors.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <istream>
#include <map>

namespace rt73 {

namespace {

constexpr std::uint32_t max_id = 0xFFFFFF;

std::string_view trim(std::string_view s) noexcept {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() &&
         (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.remove_suffix(1);
  }
  return s;
}

// keeps printable ASCII only
std::string printable_ascii(std::string_view s) {
  std::string res;
  res.reserve(s.size());
  for (const char c : s) {
    if (c >= 0x20 && c < 0x7F) {
      res.push_back(c);
    }
  }
  return res;
}

class CsvTable {
public:
  CsvTable(std::istream &is, std::string_view table,
           std::span<const std::string_view> required)
      : m_is{is}, m_table{table} {
    std::string line;
    if (!std::getline(m_is, line)) {
      throw EncodeError(fmt::format("{}: empty CSV input", m_table), m_table);
    }
    if (line.starts_with("\xEF\xBB\xBF")) {
      line.erase(0, 3);
    }
    const auto names = split_csv_line(line);
    for (std::size_t i = 0; i < names.size(); ++i) {
      m_columns.emplace(std::string{trim(names[i])}, i);
    }
    for (const auto name : required) {
      if (!m_columns.contains(name)) {
        throw EncodeError(
            fmt::format("{}: CSV header lacks column {}", m_table, name),
            m_table, std::nullopt, name);
      }
    }
  }

  // false at the end of the input
  bool next() {
    std::string line;
    while (std::getline(m_is, line)) {
      ++m_line;
      if (trim(line).empty()) {
        continue;
      }
      m_row = split_csv_line(line);
      if (m_row.size() < m_columns.size()) {
        throw EncodeError(fmt::format("{}: line {} has {} columns instead "
                                      "of {}",
                                      m_table, m_line + 1, m_row.size(),
                                      m_columns.size()),
                          m_table, m_line);
      }
      return true;
    }
    return false;
  }

  std::string_view operator[](std::string_view column) const {
    return trim(m_row[m_columns.find(column)->second]);
  }

  std::uint32_t id(std::string_view column) const {
    const auto text = (*this)[column];
    std::uint32_t val{};
    const auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), val);
    if (ec != std::errc{} || ptr != text.data() + text.size() || val == 0 ||
        val > max_id) {
      throw EncodeError(fmt::format("{}: line {} has an invalid {} '{}'",
                                    m_table, m_line + 1, column, text),
                        m_table, m_line, column);
    }
    return val;
  }

  std::string_view table() const noexcept { return m_table; }
  std::uint32_t line() const noexcept { return m_line + 1; }

private:
  std::istream &m_is;
  std::string_view m_table;
  std::map<std::string, std::size_t, std::less<>> m_columns;
  std::vector<std::string> m_row;
  std::uint32_t m_line{};
};

BulkEntry make_entry(const CsvTable &csv, std::uint32_t id,
                     std::string_view text, std::size_t text_capacity) {
  auto clean = printable_ascii(text);
  if (clean.size() > text_capacity) {
    spdlog::debug("{}: line {} text '{}' truncated to {} characters",
                  csv.table(), csv.line(), clean, text_capacity);
    clean.resize(text_capacity);
  }
  return BulkEntry{id, std::move(clean)};
}

} // namespace

std::vector<std::string> split_csv_line(std::string_view line) {
  std::vector<std::string> fields(1);
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        fields.back().push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        fields.back().push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.emplace_back();
    } else if (c != '\r' && c != '\n') {
      fields.back().push_back(c);
    }
  }
  return fields;
}

std::vector<BulkEntry> read_contacts_csv(std::istream &is,
                                         std::size_t text_capacity) {
  static constexpr std::array<std::string_view, 7> columns{
      "RADIO_ID"sv, "CALLSIGN"sv, "FIRST_NAME"sv, "LAST_NAME"sv,
      "CITY"sv,     "STATE"sv,    "COUNTRY"sv};
  CsvTable csv{is, "ham_contacts"sv, columns};
  std::vector<BulkEntry> res;
  while (csv.next()) {
    const auto last = csv["LAST_NAME"sv];
    const auto name =
        last.empty() ? std::string{csv["FIRST_NAME"sv]}
                     : fmt::format("{} {}", csv["FIRST_NAME"sv], last);
    res.push_back(make_entry(
        csv, csv.id("RADIO_ID"sv),
        fmt::format("{},{},{},{},{}", csv["CALLSIGN"sv], name, csv["CITY"sv],
                    csv["STATE"sv], csv["COUNTRY"sv]),
        text_capacity));
  }
  spdlog::info("Read {} contacts", res.size());
  return res;
}

std::vector<BulkEntry> read_groups_csv(std::istream &is,
                                       std::size_t text_capacity) {
  static constexpr std::array<std::string_view, 2> columns{"GROUP_ID"sv,
                                                           "GROUP_NAME"sv};
  CsvTable csv{is, "ham_groups"sv, columns};
  std::vector<BulkEntry> res;
  while (csv.next()) {
    res.push_back(make_entry(csv, csv.id("GROUP_ID"sv), csv["GROUP_NAME"sv],
                             text_capacity));
  }
  spdlog::info("Read {} groups", res.size());
  return res;
}

BulkTable::BulkTable(Layout::MemoryMap map)
    : m_codec{std::move(map)},
      m_header{m_codec.map().region_for("header"sv)},
      m_entries{m_codec.map().region_for("entries"sv)} {}

std::size_t BulkTable::text_capacity() const noexcept {
  const auto it = rg::find_if(m_entries.fields, [](const Layout::FieldSpec &f) {
    return f.name == "text"sv;
  });
  if (it == m_entries.fields.end()) {
    return 0;
  }
  const auto *text = std::get_if<Layout::FixedText>(&it->encoding);
  return text ? text->length : 0;
}

byte_vector BulkTable::encode(std::span<const BulkEntry> entries) const {
  if (entries.size() > capacity()) {
    throw EncodeError(fmt::format("{} entries exceed the {} capacity of '{}'",
                                  entries.size(), capacity(), map().name()),
                      m_entries.name);
  }
  const auto count = static_cast<std::uint32_t>(entries.size());
  byte_vector bytes(m_header.length + count * m_entries.stride);
  const auto out = std::span{bytes};

  m_codec.encode_region(
      m_header,
      {Record{0,
              {{"count", std::int64_t{count}},
               {"record_size", std::int64_t{m_entries.stride}}},
              {}}},
      out.first(m_header.length));

  std::vector<Record> records;
  records.reserve(count);
  for (const auto [slot, entry] : entries | rgv::enumerate) {
    if (entry.id == 0 || entry.id > max_id) {
      throw EncodeError(fmt::format("{}[{}]: id {} is outside 1..{}",
                                    m_entries.name, slot, entry.id, max_id),
                        m_entries.name, static_cast<std::uint32_t>(slot),
                        "id");
    }
    records.push_back(Record{static_cast<std::uint32_t>(slot),
                             {{"id", std::int64_t{entry.id}},
                              {"text", entry.text}},
                             {}});
  }
  // the used prefix of the entries region
  auto used = m_entries;
  used.length = count * m_entries.stride;
  m_codec.encode_region(used, records, out.subspan(m_header.length));
  return bytes;
}

std::vector<BulkEntry>
BulkTable::decode(std::span<const std::uint8_t> bytes) const {
  if (bytes.size() < m_header.length) {
    throw DecodeError(fmt::format("Table '{}' needs at least {} bytes, got {}",
                                  map().name(), m_header.length, bytes.size()),
                      m_header.name, static_cast<std::uint32_t>(bytes.size()));
  }
  const auto header =
      m_codec.decode_region(m_header, bytes.first(m_header.length));
  std::int64_t count = 0;
  if (!header.empty()) {
    count = std::get<std::int64_t>(header.front().at("count"sv));
    const auto record_size =
        std::get<std::int64_t>(header.front().at("record_size"sv));
    if (record_size != m_entries.stride) {
      throw DecodeError(fmt::format("Table '{}' holds {} byte records, "
                                    "expected {}",
                                    map().name(), record_size,
                                    m_entries.stride),
                        m_header.name, 4);
    }
  }
  if (count > capacity() ||
      bytes.size() != m_header.length + count * m_entries.stride) {
    throw DecodeError(fmt::format("Table '{}' of {} bytes does not hold {} "
                                  "entries",
                                  map().name(), bytes.size(), count),
                      m_header.name, 0);
  }
  auto used = m_entries;
  used.length = static_cast<std::uint32_t>(count) * m_entries.stride;
  const auto records =
      m_codec.decode_region(used, bytes.subspan(m_header.length));
  if (records.size() != static_cast<std::size_t>(count)) {
    throw DecodeError(
        fmt::format("Table '{}' has blank entries", map().name()),
        m_entries.name, m_header.length);
  }
  std::vector<BulkEntry> res;
  res.reserve(records.size());
  for (const auto &r : records) {
    res.push_back(BulkEntry{
        static_cast<std::uint32_t>(std::get<std::int64_t>(r.at("id"sv))),
        std::get<std::string>(r.at("text"sv))});
  }
  return res;
}

} // namespace rt73
