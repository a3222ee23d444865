/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DELIMITED_READER_HPP
#define DELIMITED_READER_HPP

#include "core/MapError.hpp"
#include "map/Wrappers.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MapForge {

/**
 * @brief How a delimited load treats a row that fails to decode
 */
enum class RowPolicy : uint8_t {
  Strict, // First bad row aborts the load
  Loose   // Bad rows are skipped and counted
};

struct DelimitedOptions {
  char delimiter{';'};
  bool hasHeader{false};
  RowPolicy policy{RowPolicy::Strict};
};

/**
 * @brief One split row, addressed by column index or header name
 *
 * Typed getters throw MapError(CsvRow) naming the column when the field is
 * missing or does not parse.
 */
class DelimitedRow {
public:
  DelimitedRow(std::vector<std::string_view> fields,
               const std::vector<std::string> *header, size_t lineNumber)
      : m_fields(std::move(fields)), m_header(header), m_lineNumber(lineNumber) {}

  size_t size() const { return m_fields.size(); }
  size_t lineNumber() const { return m_lineNumber; }

  // Raw text; empty view when the column is absent from the row or header
  std::string_view text(size_t column) const;
  std::string_view text(std::string_view name) const;

  template <typename T> T get(size_t column) const {
    if (column >= m_fields.size()) {
      fail(column, "missing column");
    }
    return parseField<T>(m_fields[column], column);
  }

  template <typename T> T get(std::string_view name) const {
    return get<T>(requireColumn(name));
  }

  /**
   * @brief Absent or empty column gives nullopt
   */
  template <typename T> std::optional<T> getOptional(size_t column) const {
    if (column >= m_fields.size() || m_fields[column].empty()) {
      return std::nullopt;
    }
    return parseField<T>(m_fields[column], column);
  }

  template <typename T>
  std::optional<T> getOptional(std::string_view name) const {
    return getOptional<T>(columnOf(name));
  }

  [[noreturn]] void fail(size_t column, const std::string &reason) const;

private:
  template <typename T> T parseField(std::string_view field, size_t column) const {
    try {
      if constexpr (requires { T::parse(field); }) {
        return T::parse(field);
      } else {
        return ScalarTraits<T>::parse(field, "field");
      }
    } catch (const MapError &e) {
      fail(column, e.what());
    }
  }

  // Header lookup ignores case and underscores; npos when absent
  size_t columnOf(std::string_view name) const;
  size_t requireColumn(std::string_view name) const;

  std::vector<std::string_view> m_fields;
  const std::vector<std::string> *m_header;
  size_t m_lineNumber;
};

/**
 * @brief Reads semicolon separated files row by row
 *
 * Usage:
 *   DelimitedReader reader(path, {';', false, RowPolicy::Strict});
 *   auto rows = reader.readAll<Definition>(&Definition::fromRow);
 */
class DelimitedReader {
public:
  DelimitedReader(std::filesystem::path path, DelimitedOptions options);

  /**
   * @brief Decodes every data row with decodeRow
   * @throws MapError FileNotFound/Io, or CsvRow for the first bad row in
   *         strict mode
   */
  template <typename Record>
  std::vector<Record>
  readAll(const std::function<Record(const DelimitedRow &)> &decodeRow) {
    std::vector<Record> records;
    forEachRow([&](const DelimitedRow &row) {
      records.push_back(decodeRow(row));
      return true;
    });
    return records;
  }

  /**
   * @brief Like readAll, but the first row matching isEnd ends the data
   *
   * The end row and every row after it are neither decoded nor checked.
   * isEnd sees each row before decodeRow; a throw from it counts as a bad row.
   */
  template <typename Record>
  std::vector<Record>
  readUntil(const std::function<bool(const DelimitedRow &)> &isEnd,
            const std::function<Record(const DelimitedRow &)> &decodeRow) {
    std::vector<Record> records;
    forEachRow([&](const DelimitedRow &row) {
      if (isEnd(row)) {
        return false;
      }
      records.push_back(decodeRow(row));
      return true;
    });
    return records;
  }

  // Rows skipped by the last loose read
  size_t skippedRows() const { return m_skippedRows; }
  const std::vector<std::string> &header() const { return m_header; }
  const std::filesystem::path &path() const { return m_path; }

private:
  // visit returns false to stop reading
  void forEachRow(const std::function<bool(const DelimitedRow &)> &visit);

  std::filesystem::path m_path;
  DelimitedOptions m_options;
  std::vector<std::string> m_header;
  size_t m_skippedRows{0};
};

/**
 * @brief Splits one line on the delimiter, keeping empty fields
 */
std::vector<std::string_view> splitDelimited(std::string_view line,
                                             char delimiter);

} // namespace MapForge

#endif // DELIMITED_READER_HPP
