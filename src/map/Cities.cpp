/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Cities.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include <format>

namespace MapForge {

BuildingMesh BuildingMesh::fromClause(const ClauseValue &value) {
  requireObject(value, "building");
  BuildingMesh mesh;
  mesh.distance = requiredField<Distance>(value, "distance");
  mesh.meshes = requiredField<std::vector<MeshId>>(value, "mesh");
  return mesh;
}

ClauseValue BuildingMesh::toClause() const {
  ClauseValue block = ClauseValue::block();
  putField(block, "distance", distance);
  putField(block, "mesh", meshes);
  return block;
}

CityGroup CityGroup::fromClause(const ClauseValue &value) {
  requireObject(value, "city_group");
  CityGroup group;
  group.colorIndex = requiredField<ColorIndex>(value, "color_index");
  group.density = requiredField<PixelDensity>(value, "density");
  group.buildings = repeatedField<BuildingMesh>(value, "building");
  return group;
}

ClauseValue CityGroup::toClause() const {
  ClauseValue block = ClauseValue::block();
  putField(block, "color_index", colorIndex);
  putField(block, "density", density);
  putRepeated(block, "building", buildings);
  return block;
}

Cities Cities::fromFile(const std::filesystem::path &path) {
  try {
    Cities cities = fromClause(loadClauseFile(path));
    MAPLOADER_DEBUG(std::format("{}: {} city groups", path.string(),
                                cities.groups.size()));
    return cities;
  } catch (const MapError &e) {
    if (e.path().empty()) {
      throw MapError(e.code(), std::format("{}: {}", path.string(), e.what()), path);
    }
    throw;
  }
}

Cities Cities::fromClause(const ClauseValue &document) {
  Cities cities;
  cities.typesSource = requiredField<std::filesystem::path>(document, "types_source");
  cities.pixelStepX = requiredField<PixelStep>(document, "pixel_step_x");
  cities.pixelStepY = requiredField<PixelStep>(document, "pixel_step_y");
  cities.groups = repeatedField<CityGroup>(document, "city_group");
  return cities;
}

ClauseValue Cities::toClause() const {
  ClauseValue document = ClauseValue::block();
  putField(document, "types_source", typesSource);
  putField(document, "pixel_step_x", pixelStepX);
  putField(document, "pixel_step_y", pixelStepY);
  putRepeated(document, "city_group", groups);
  return document;
}

} // namespace MapForge
