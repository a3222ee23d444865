/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Buildings.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include "utils/DelimitedReader.hpp"
#include <format>

namespace MapForge {

StateBuilding StateBuilding::fromRow(const DelimitedRow &row) {
  StateBuilding building;
  building.state = row.get<StateId>(0);
  building.building = row.get<BuildingId>(1);
  building.x = row.get<float>(2);
  building.y = row.get<float>(3);
  building.z = row.get<float>(4);
  building.rotation = row.get<float>(5);
  building.adjacentSeaProvince =
      row.getOptional<ProvinceId>(6).value_or(ProvinceId(0));
  return building;
}

std::ostream &operator<<(std::ostream &os, const StateBuilding &building) {
  return os << "StateBuilding(" << building.state.get() << ", "
            << building.building.get() << " @ " << building.x << ", "
            << building.y << ", " << building.z << ")";
}

std::unordered_set<BuildingId>
Buildings::loadTypes(const std::filesystem::path &typesPath) {
  auto keys = firstBlockKeys(loadClauseFile(typesPath));
  if (!keys) {
    throw MapError(MapErrorCode::InvalidBuildingsFile,
                   std::format("{}: no building type block", typesPath.string()),
                   typesPath);
  }

  std::unordered_set<BuildingId> types;
  for (auto &key : *keys) {
    BuildingId id(std::move(key));
    if (!types.insert(id).second) {
      throw MapError(MapErrorCode::DuplicateBuildingType,
                     std::format("{}: building type '{}' declared twice",
                                 typesPath.string(), id.get()),
                     typesPath);
    }
  }
  types.insert(BuildingId(IMPLICIT_TYPE));
  return types;
}

Buildings Buildings::fromFiles(const std::filesystem::path &typesPath,
                               const std::filesystem::path &buildingsPath) {
  Buildings result;
  result.m_types = loadTypes(typesPath);

  DelimitedReader reader(buildingsPath, {';', false, RowPolicy::Loose});
  auto placements = reader.readAll<StateBuilding>(&StateBuilding::fromRow);
  result.m_skippedRows = reader.skippedRows();

  result.m_buildings.reserve(placements.size());
  for (auto &placement : placements) {
    if (!result.isDeclared(placement.building)) {
      ++result.m_dropped;
      BUILDINGS_WARN(std::format("building '{}' in state {} is not a declared type",
                                 placement.building.get(), placement.state.get()));
      continue;
    }
    result.m_buildings.push_back(std::move(placement));
  }

  BUILDINGS_INFO(std::format("loaded {} buildings of {} types ({} dropped)",
                             result.size(), result.m_types.size(),
                             result.m_dropped));
  return result;
}

} // namespace MapForge
