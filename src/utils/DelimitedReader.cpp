/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/DelimitedReader.hpp"
#include "core/Logger.hpp"
#include "utils/TextFile.hpp"
#include <cctype>
#include <format>

namespace MapForge {

std::vector<std::string_view> splitDelimited(std::string_view line,
                                             char delimiter) {
  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    size_t end = line.find(delimiter, start);
    if (end == std::string_view::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, end - start));
    start = end + 1;
  }
  return fields;
}

std::string_view DelimitedRow::text(size_t column) const {
  return column < m_fields.size() ? m_fields[column] : std::string_view{};
}

std::string_view DelimitedRow::text(std::string_view name) const {
  return text(columnOf(name));
}

namespace {

std::string normalizeColumnName(std::string_view name) {
  std::string result;
  result.reserve(name.size());
  for (char c : name) {
    if (c != '_') {
      result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return result;
}

} // anonymous namespace

size_t DelimitedRow::columnOf(std::string_view name) const {
  if (m_header == nullptr) {
    return std::string_view::npos;
  }
  std::string wanted = normalizeColumnName(name);
  for (size_t i = 0; i < m_header->size(); ++i) {
    if (normalizeColumnName((*m_header)[i]) == wanted) {
      return i;
    }
  }
  return std::string_view::npos;
}

size_t DelimitedRow::requireColumn(std::string_view name) const {
  size_t column = columnOf(name);
  if (column == std::string_view::npos) {
    throw MapError(MapErrorCode::CsvRow,
                   std::format("line {}: no column named '{}'", m_lineNumber, name));
  }
  return column;
}

void DelimitedRow::fail(size_t column, const std::string &reason) const {
  std::string columnName = std::to_string(column);
  if (m_header != nullptr && column < m_header->size()) {
    columnName = (*m_header)[column];
  }
  throw MapError(MapErrorCode::CsvRow,
                 std::format("line {}, column {}: {}", m_lineNumber, columnName,
                             reason));
}

DelimitedReader::DelimitedReader(std::filesystem::path path,
                                 DelimitedOptions options)
    : m_path(std::move(path)), m_options(options) {}

void DelimitedReader::forEachRow(
    const std::function<bool(const DelimitedRow &)> &visit) {
  std::string text = readLegacyTextFile(m_path);
  auto lines = splitLines(text);

  m_header.clear();
  m_skippedRows = 0;

  size_t lineNumber = 0;
  bool headerPending = m_options.hasHeader;
  for (std::string_view line : lines) {
    ++lineNumber;
    if (trim(line).empty()) {
      continue;
    }

    auto fields = splitDelimited(line, m_options.delimiter);
    if (headerPending) {
      for (std::string_view name : fields) {
        m_header.emplace_back(trim(name));
      }
      headerPending = false;
      continue;
    }

    DelimitedRow row(std::move(fields),
                     m_options.hasHeader ? &m_header : nullptr, lineNumber);
    bool keepReading = true;
    try {
      keepReading = visit(row);
    } catch (const MapError &e) {
      if (m_options.policy == RowPolicy::Strict) {
        throw MapError(e.code(), std::format("{}: {}", m_path.string(), e.what()),
                       m_path);
      }
      ++m_skippedRows;
      CSV_DEBUG(std::format("{}: skipping row: {}", m_path.string(), e.what()));
    }
    if (!keepReading) {
      CSV_DEBUG(std::format("{}: data ends at line {}", m_path.string(), lineNumber));
      break;
    }
  }

  if (m_skippedRows > 0) {
    CSV_WARN(std::format("{}: skipped {} malformed rows", m_path.string(),
                         m_skippedRows));
  }
}

} // namespace MapForge
