/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Seasons.hpp"
#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include <format>

namespace MapForge {

const std::array<const char *, 8> Seasons::TREE_KEYS = {
    "tree_winter", "tree_winter2", "tree_spring", "tree_spring2",
    "tree_summer", "tree_summer2", "tree_autumn", "tree_autumn2"};

namespace {

Hsv hsvField(const ClauseValue &object, std::string_view key) {
  auto found = collectField(object, key, OnRepeat::Replace);
  if (found.empty()) {
    throw MapError(MapErrorCode::Decode,
                   std::format("missing required key '{}'", key));
  }
  try {
    const auto &parts = requireArray(*found.front(), "hsv", 3);
    return Hsv{decodeClause<float>(parts[0].value),
               decodeClause<float>(parts[1].value),
               decodeClause<float>(parts[2].value)};
  } catch (const MapError &e) {
    throw e.wrap(std::string(key));
  }
}

void putHsv(ClauseValue &object, std::string key, const Hsv &hsv) {
  putField(object, std::move(key),
           std::vector<float>{hsv.hue, hsv.saturation, hsv.value});
}

} // anonymous namespace

Season Season::fromClause(const ClauseValue &value) {
  requireObject(value, "season");
  Season season;
  season.startDate = requiredField<SeasonDate>(value, "start_date");
  season.endDate = requiredField<SeasonDate>(value, "end_date");
  season.hsvNorth = hsvField(value, "hsv_north");
  season.colorBalanceNorth = hsvField(value, "colorbalance_north");
  season.hsvCenter = hsvField(value, "hsv_center");
  season.colorBalanceCenter = hsvField(value, "colorbalance_center");
  season.hsvSouth = hsvField(value, "hsv_south");
  season.colorBalanceSouth = hsvField(value, "colorbalance_south");
  return season;
}

ClauseValue Season::toClause() const {
  ClauseValue block = ClauseValue::block();
  putField(block, "start_date", startDate);
  putField(block, "end_date", endDate);
  putHsv(block, "hsv_north", hsvNorth);
  putHsv(block, "colorbalance_north", colorBalanceNorth);
  putHsv(block, "hsv_center", hsvCenter);
  putHsv(block, "colorbalance_center", colorBalanceCenter);
  putHsv(block, "hsv_south", hsvSouth);
  putHsv(block, "colorbalance_south", colorBalanceSouth);
  return block;
}

TreeSeason TreeSeason::fromClause(const ClauseValue &value) {
  requireObject(value, "tree season");
  return TreeSeason{requiredField<SeasonDate>(value, "start_date"),
                    requiredField<SeasonDate>(value, "end_date")};
}

ClauseValue TreeSeason::toClause() const {
  ClauseValue block = ClauseValue::block();
  putField(block, "start_date", startDate);
  putField(block, "end_date", endDate);
  return block;
}

std::ostream &operator<<(std::ostream &os, const Season &season) {
  return os << "Season(" << season.startDate << " - " << season.endDate << ")";
}

std::ostream &operator<<(std::ostream &os, const TreeSeason &season) {
  return os << "TreeSeason(" << season.startDate << " - " << season.endDate
            << ")";
}

Seasons Seasons::fromFile(const std::filesystem::path &path) {
  try {
    return fromClause(loadClauseFile(path));
  } catch (const MapError &e) {
    if (e.path().empty()) {
      throw MapError(e.code(), std::format("{}: {}", path.string(), e.what()), path);
    }
    throw;
  }
}

Seasons Seasons::fromClause(const ClauseValue &document) {
  Seasons seasons;
  seasons.winter = requiredField<Season>(document, "winter");
  seasons.spring = requiredField<Season>(document, "spring");
  seasons.summer = requiredField<Season>(document, "summer");
  seasons.autumn = requiredField<Season>(document, "autumn");
  for (size_t i = 0; i < TREE_KEYS.size(); ++i) {
    seasons.trees[i] = requiredField<TreeSeason>(document, TREE_KEYS[i]);
  }
  return seasons;
}

ClauseValue Seasons::toClause() const {
  ClauseValue document = ClauseValue::block();
  putField(document, "winter", winter);
  putField(document, "spring", spring);
  putField(document, "summer", summer);
  putField(document, "autumn", autumn);
  for (size_t i = 0; i < TREE_KEYS.size(); ++i) {
    putField(document, TREE_KEYS[i], trees[i]);
  }
  return document;
}

} // namespace MapForge
