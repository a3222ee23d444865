/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLACEMENTS_HPP
#define PLACEMENTS_HPP

#include "map/Wrappers.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace MapForge {

class DelimitedRow;

// province;model;x;y;z;rotation;scale
struct UnitStack {
  ProvinceId province;
  ModelIndex model;
  float x{0.0f};
  float y{0.0f};
  float z{0.0f};
  float rotation{0.0f};
  float scale{1.0f};

  static UnitStack fromRow(const DelimitedRow &row);

  bool operator==(const UnitStack &) const = default;
};

enum class WeatherType : uint8_t { Big, Small };

std::optional<WeatherType> parseWeatherType(std::string_view text);
const char *toString(WeatherType type);
std::ostream &operator<<(std::ostream &os, WeatherType type);

// region;x;y;z;big|small
struct WeatherPosition {
  StrategicRegionId region;
  float x{0.0f};
  float y{0.0f};
  float z{0.0f};
  WeatherType type{WeatherType::Small};

  static WeatherPosition fromRow(const DelimitedRow &row);

  bool operator==(const WeatherPosition &) const = default;
};

/**
 * @brief Records of a headerless placement file; malformed rows are skipped
 */
template <typename Record> class PlacementList {
public:
  static PlacementList fromFile(const std::filesystem::path &path);

  const std::vector<Record> &records() const { return m_records; }
  size_t size() const { return m_records.size(); }
  size_t skippedRows() const { return m_skippedRows; }

private:
  std::vector<Record> m_records;
  size_t m_skippedRows{0};
};

using UnitStacks = PlacementList<UnitStack>;
using WeatherPositions = PlacementList<WeatherPosition>;

extern template class PlacementList<UnitStack>;
extern template class PlacementList<WeatherPosition>;

} // namespace MapForge

#endif // PLACEMENTS_HPP
