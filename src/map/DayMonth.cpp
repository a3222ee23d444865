/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/DayMonth.hpp"
#include "core/MapError.hpp"
#include "map/Wrappers.hpp"
#include <format>
#include <vector>

namespace MapForge {
namespace {

std::vector<std::string_view> splitDots(std::string_view text) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    size_t dot = text.find('.', start);
    parts.push_back(text.substr(start, dot - start));
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  return parts;
}

} // anonymous namespace

DayMonth::DayMonth(uint8_t day, uint8_t month) : m_day(day), m_month(month) {
  if (day > MAX_DAY || month > MAX_MONTH) {
    throw MapError(MapErrorCode::InvalidScalar,
                   std::format("invalid DayMonth {}.{}: day must be at most {} "
                               "and month at most {}",
                               day, month, MAX_DAY, MAX_MONTH));
  }
}

DayMonth DayMonth::parse(std::string_view text) {
  auto parts = splitDots(text);
  if (parts.size() != 2) {
    throw MapError(MapErrorCode::InvalidScalar,
                   std::format("invalid DayMonth literal '{}'", text));
  }
  uint8_t day = ScalarTraits<uint8_t>::parse(parts[0], "DayMonth");
  uint8_t month = ScalarTraits<uint8_t>::parse(parts[1], "DayMonth");
  return DayMonth(day, month);
}

std::string DayMonth::toString() const {
  return std::format("{}.{}", m_day, m_month);
}

std::ostream &operator<<(std::ostream &os, const DayMonth &dayMonth) {
  return os << dayMonth.toString();
}

SeasonDate::SeasonDate(int32_t year, uint8_t month, uint8_t day)
    : m_year(year), m_month(month), m_day(day) {
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    throw MapError(MapErrorCode::InvalidScalar,
                   std::format("invalid date {}.{}.{}", year, month, day));
  }
}

SeasonDate SeasonDate::parse(std::string_view text) {
  auto parts = splitDots(text);
  if (parts.size() != 3) {
    throw MapError(MapErrorCode::InvalidScalar,
                   std::format("invalid date literal '{}'", text));
  }
  return SeasonDate(ScalarTraits<int32_t>::parse(parts[0], "SeasonDate"),
                    ScalarTraits<uint8_t>::parse(parts[1], "SeasonDate"),
                    ScalarTraits<uint8_t>::parse(parts[2], "SeasonDate"));
}

std::string SeasonDate::toString() const {
  return std::format("{:02}.{:02}.{:02}", m_year, m_month, m_day);
}

std::ostream &operator<<(std::ostream &os, const SeasonDate &date) {
  return os << date.toString();
}

} // namespace MapForge
