/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/StrategicRegions.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include "utils/TextFile.hpp"
#include <format>

namespace MapForge {

Period Period::fromClause(const ClauseValue &value) {
  requireObject(value, "period");
  Period period;

  auto between = requiredField<std::vector<DayMonth>>(value, "between");
  if (between.empty() || between.size() % 2 != 0) {
    throw MapError(MapErrorCode::Decode,
                   std::format("between: expected start/end pairs, found {} dates",
                               between.size()));
  }
  for (size_t i = 0; i < between.size(); i += 2) {
    period.between.push_back({between[i], between[i + 1]});
  }

  auto temperature = collectField(value, "temperature", OnRepeat::Replace);
  if (temperature.empty()) {
    throw MapError(MapErrorCode::Decode, "missing required key 'temperature'");
  }
  const auto &bounds = requireArray(*temperature.front(), "temperature", 2);
  period.temperature = {decodeClause<Temperature>(bounds[0].value),
                        decodeClause<Temperature>(bounds[1].value)};

  period.noPhenomenon = requiredField<Weight>(value, "no_phenomenon");
  period.rainLight = requiredField<Weight>(value, "rain_light");
  period.rainHeavy = requiredField<Weight>(value, "rain_heavy");
  period.snow = requiredField<Weight>(value, "snow");
  period.blizzard = requiredField<Weight>(value, "blizzard");
  period.arcticWater = requiredField<Weight>(value, "arctic_water");
  period.mud = requiredField<Weight>(value, "mud");
  period.sandstorm = requiredField<Weight>(value, "sandstorm");
  period.minSnowLevel = requiredField<SnowLevel>(value, "min_snow_level");
  return period;
}

ClauseValue Period::toClause() const {
  ClauseValue block = ClauseValue::block();

  std::vector<DayMonth> flat;
  for (const auto &range : between) {
    flat.push_back(range.start);
    flat.push_back(range.end);
  }
  putField(block, "between", flat);
  putField(block, "temperature",
           std::vector<Temperature>{temperature.low, temperature.high});
  putField(block, "no_phenomenon", noPhenomenon);
  putField(block, "rain_light", rainLight);
  putField(block, "rain_heavy", rainHeavy);
  putField(block, "snow", snow);
  putField(block, "blizzard", blizzard);
  putField(block, "arctic_water", arcticWater);
  putField(block, "mud", mud);
  putField(block, "sandstorm", sandstorm);
  putField(block, "min_snow_level", minSnowLevel);
  return block;
}

StrategicRegion StrategicRegion::fromClause(const ClauseValue &value) {
  requireObject(value, "strategic_region");
  StrategicRegion region;
  region.id = requiredField<StrategicRegionId>(value, "id");
  region.name = requiredField<StrategicRegionName>(value, "name");
  region.provinces = requiredField<std::vector<ProvinceId>>(value, "provinces");

  auto weather = collectField(value, "weather", OnRepeat::Replace);
  if (weather.empty()) {
    throw MapError(MapErrorCode::Decode, "missing required key 'weather'");
  }
  try {
    region.weather = repeatedField<Period>(*weather.front(), "period");
  } catch (const MapError &e) {
    throw e.wrap("weather");
  }
  return region;
}

ClauseValue StrategicRegion::toClause() const {
  ClauseValue block = ClauseValue::block();
  putField(block, "id", id);
  putField(block, "name", name);
  putField(block, "provinces", provinces);
  ClauseValue periods = ClauseValue::block();
  putRepeated(periods, "period", weather);
  block.add("weather", std::move(periods));
  return block;
}

std::ostream &operator<<(std::ostream &os, const StrategicRegion &region) {
  return os << "StrategicRegion(" << region.id.get() << ", " << region.name.get()
            << ", " << region.provinces.size() << " provinces, "
            << region.weather.size() << " periods)";
}

std::pair<StrategicRegionId, std::string>
StrategicRegions::splitFileName(const std::string &fileName) {
  size_t dash = fileName.find('-');
  if (dash == std::string::npos) {
    throw MapError(MapErrorCode::InvalidStrategicRegionFileName,
                   std::format("strategic region file name '{}' has no '-'",
                               fileName));
  }
  try {
    return {StrategicRegionId::parse(std::string_view(fileName).substr(0, dash)),
            fileName.substr(dash + 1)};
  } catch (const MapError &e) {
    throw MapError(MapErrorCode::InvalidStrategicRegionFileName,
                   std::format("strategic region file name '{}': {}", fileName,
                               e.what()));
  }
}

StrategicRegion StrategicRegions::loadFile(const std::filesystem::path &path) {
  ClauseValue document = loadClauseFile(path);
  try {
    return requiredField<StrategicRegion>(document, "strategic_region");
  } catch (const MapError &e) {
    throw MapError(e.code(), std::format("{}: {}", path.string(), e.what()), path);
  }
}

StrategicRegions
StrategicRegions::fromDirectory(const std::filesystem::path &directory) {
  auto files = listRegularFiles(directory, "strategic region");

  StrategicRegions result;
  for (const auto &file : files) {
    std::string fileName = file.filename().string();
    auto [fileId, suffix] = splitFileName(fileName);
    if (fileId.get() < 1 || suffix != FILE_SUFFIX) {
      REGION_WARN(std::format("strategic region file name is not correct: {}",
                              fileName));
    }

    StrategicRegion region = loadFile(file);
    if (region.id.get() == 0) {
      throw MapError(MapErrorCode::InvalidStrategicRegion,
                     std::format("{}: strategic region id must not be 0",
                                 file.string()),
                     file);
    }
    if (region.name.get().empty()) {
      throw MapError(MapErrorCode::InvalidStrategicRegionName,
                     std::format("{}: strategic region {} has an empty name",
                                 file.string(), region.id.get()),
                     file);
    }
    if (region.id != fileId) {
      throw MapError(MapErrorCode::InvalidStrategicRegionFileName,
                     std::format("{}: declares id {} but the file name says {}",
                                 file.string(), region.id.get(), fileId.get()),
                     file);
    }

    StrategicRegionId id = region.id;
    result.m_regions.insert_or_assign(id, std::move(region));
  }

  REGION_INFO(std::format("loaded {} strategic regions from {}", result.size(),
                          directory.string()));
  return result;
}

const StrategicRegion *StrategicRegions::find(StrategicRegionId id) const {
  auto it = m_regions.find(id);
  return it != m_regions.end() ? &it->second : nullptr;
}

} // namespace MapForge
