/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DAY_MONTH_HPP
#define DAY_MONTH_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace MapForge {

/**
 * @brief Zero-indexed day and month used by weather periods ("D.M")
 *
 * Day 0 is the first of the month and month 0 is January, so the largest
 * accepted literal is "30.11".
 */
class DayMonth {
public:
  static constexpr uint8_t MAX_DAY = 30;
  static constexpr uint8_t MAX_MONTH = 11;

  constexpr DayMonth() = default;

  /**
   * @throws MapError(InvalidScalar) when day or month is out of range
   */
  DayMonth(uint8_t day, uint8_t month);

  /**
   * @brief Parses "D.M"; exactly two integer parts are required
   * @throws MapError(InvalidScalar)
   */
  static DayMonth parse(std::string_view text);

  constexpr uint8_t day() const noexcept { return m_day; }
  constexpr uint8_t month() const noexcept { return m_month; }

  std::string toString() const;

  bool operator==(const DayMonth &) const = default;

private:
  uint8_t m_day{0};
  uint8_t m_month{0};
};

std::ostream &operator<<(std::ostream &os, const DayMonth &dayMonth);

/**
 * @brief Calendar date written as "Y.M.D" (seasons use year 0)
 */
class SeasonDate {
public:
  constexpr SeasonDate() = default;

  /**
   * @throws MapError(InvalidScalar) when month is outside 1-12 or day outside 1-31
   */
  SeasonDate(int32_t year, uint8_t month, uint8_t day);

  static SeasonDate parse(std::string_view text);

  constexpr int32_t year() const noexcept { return m_year; }
  constexpr uint8_t month() const noexcept { return m_month; }
  constexpr uint8_t day() const noexcept { return m_day; }

  std::string toString() const;

  bool operator==(const SeasonDate &) const = default;

private:
  int32_t m_year{0};
  uint8_t m_month{1};
  uint8_t m_day{1};
};

std::ostream &operator<<(std::ostream &os, const SeasonDate &date);

} // namespace MapForge

#endif // DAY_MONTH_HPP
