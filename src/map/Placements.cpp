/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Placements.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/DelimitedReader.hpp"
#include <format>

namespace MapForge {

UnitStack UnitStack::fromRow(const DelimitedRow &row) {
  UnitStack stack;
  stack.province = row.get<ProvinceId>(0);
  stack.model = row.get<ModelIndex>(1);
  stack.x = row.get<float>(2);
  stack.y = row.get<float>(3);
  stack.z = row.get<float>(4);
  stack.rotation = row.get<float>(5);
  stack.scale = row.get<float>(6);
  return stack;
}

std::optional<WeatherType> parseWeatherType(std::string_view text) {
  if (text == "big")
    return WeatherType::Big;
  if (text == "small")
    return WeatherType::Small;
  return std::nullopt;
}

const char *toString(WeatherType type) {
  switch (type) {
  case WeatherType::Big:
    return "big";
  case WeatherType::Small:
    return "small";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, WeatherType type) {
  return os << toString(type);
}

WeatherPosition WeatherPosition::fromRow(const DelimitedRow &row) {
  WeatherPosition position;
  position.region = row.get<StrategicRegionId>(0);
  position.x = row.get<float>(1);
  position.y = row.get<float>(2);
  position.z = row.get<float>(3);
  auto type = parseWeatherType(row.text(4));
  if (!type) {
    row.fail(4, std::format("expected big or small, found '{}'", row.text(4)));
  }
  position.type = *type;
  return position;
}

template <typename Record>
PlacementList<Record> PlacementList<Record>::fromFile(const std::filesystem::path &path) {
  DelimitedReader reader(path, {';', false, RowPolicy::Loose});
  PlacementList result;
  result.m_records = reader.readAll<Record>(&Record::fromRow);
  result.m_skippedRows = reader.skippedRows();
  MAPLOADER_DEBUG(std::format("{}: {} records, {} skipped", path.string(),
                              result.size(), result.m_skippedRows));
  return result;
}

template class PlacementList<UnitStack>;
template class PlacementList<WeatherPosition>;

} // namespace MapForge
