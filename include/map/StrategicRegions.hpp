/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STRATEGIC_REGIONS_HPP
#define STRATEGIC_REGIONS_HPP

#include "map/DayMonth.hpp"
#include "map/Wrappers.hpp"
#include "utils/ClauseReader.hpp"
#include <filesystem>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace MapForge {

struct DayMonthRange {
  DayMonth start;
  DayMonth end;

  bool operator==(const DayMonthRange &) const = default;
};

struct TemperatureRange {
  Temperature low;
  Temperature high;

  bool operator==(const TemperatureRange &) const = default;
};

/**
 * @brief One weather period of a strategic region
 *
 * `between` holds start/end pairs; the file writes them flat, as in
 * `between = { 0.0 30.0 }`.
 */
struct Period {
  std::vector<DayMonthRange> between;
  TemperatureRange temperature;
  Weight noPhenomenon;
  Weight rainLight;
  Weight rainHeavy;
  Weight snow;
  Weight blizzard;
  Weight arcticWater;
  Weight mud;
  Weight sandstorm;
  SnowLevel minSnowLevel;

  static Period fromClause(const ClauseValue &value);
  ClauseValue toClause() const;

  bool operator==(const Period &) const = default;
};

struct StrategicRegion {
  StrategicRegionId id;
  StrategicRegionName name;
  std::vector<ProvinceId> provinces;
  std::vector<Period> weather;

  // Decodes the inner block of `strategic_region = { ... }`
  static StrategicRegion fromClause(const ClauseValue &value);
  ClauseValue toClause() const;

  bool operator==(const StrategicRegion &) const = default;
};

std::ostream &operator<<(std::ostream &os, const StrategicRegion &region);

/**
 * @brief Every region file of map/strategicregions, keyed by id
 */
class StrategicRegions {
public:
  static constexpr const char *FILE_SUFFIX = "StrategicRegion.txt";

  /**
   * @brief Loads every file of the directory, in file name order
   *
   * A file name that does not follow `<positive id>-StrategicRegion.txt` but
   * still starts with an integer is only logged. The whole load fails when:
   * - the name has no '-' or does not start with an integer
   *   (InvalidStrategicRegionFileName)
   * - the region declares id 0 (InvalidStrategicRegion)
   * - the name is empty (InvalidStrategicRegionName)
   * - the declared id differs from the file name (InvalidStrategicRegionFileName)
   */
  static StrategicRegions fromDirectory(const std::filesystem::path &directory);

  /**
   * @brief Loads one region file without the file name checks
   */
  static StrategicRegion loadFile(const std::filesystem::path &path);

  /**
   * @brief Splits "<id>-<rest>" from a file name
   * @throws MapError(InvalidStrategicRegionFileName)
   */
  static std::pair<StrategicRegionId, std::string>
  splitFileName(const std::string &fileName);

  const StrategicRegion *find(StrategicRegionId id) const;
  size_t size() const { return m_regions.size(); }
  const std::unordered_map<StrategicRegionId, StrategicRegion> &regions() const {
    return m_regions;
  }

private:
  std::unordered_map<StrategicRegionId, StrategicRegion> m_regions;
};

} // namespace MapForge

#endif // STRATEGIC_REGIONS_HPP
