/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SEASONS_HPP
#define SEASONS_HPP

#include "map/DayMonth.hpp"
#include "map/Wrappers.hpp"
#include "utils/ClauseReader.hpp"
#include <array>
#include <filesystem>
#include <ostream>

namespace MapForge {

/**
 * @brief Terrain tint for one season, split in three latitude bands
 */
struct Season {
  SeasonDate startDate;
  SeasonDate endDate;
  Hsv hsvNorth;
  Hsv colorBalanceNorth;
  Hsv hsvCenter;
  Hsv colorBalanceCenter;
  Hsv hsvSouth;
  Hsv colorBalanceSouth;

  static Season fromClause(const ClauseValue &value);
  ClauseValue toClause() const;

  bool operator==(const Season &) const = default;
};

struct TreeSeason {
  SeasonDate startDate;
  SeasonDate endDate;

  static TreeSeason fromClause(const ClauseValue &value);
  ClauseValue toClause() const;

  bool operator==(const TreeSeason &) const = default;
};

std::ostream &operator<<(std::ostream &os, const Season &season);
std::ostream &operator<<(std::ostream &os, const TreeSeason &season);

struct Seasons {
  Season winter;
  Season spring;
  Season summer;
  Season autumn;
  // tree_winter, tree_winter2, tree_spring, ... tree_autumn2
  std::array<TreeSeason, 8> trees;

  static const std::array<const char *, 8> TREE_KEYS;

  static Seasons fromFile(const std::filesystem::path &path);
  static Seasons fromClause(const ClauseValue &document);
  ClauseValue toClause() const;

  bool operator==(const Seasons &) const = default;
};

} // namespace MapForge

#endif // SEASONS_HPP
