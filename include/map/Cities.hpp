/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CITIES_HPP
#define CITIES_HPP

#include "map/Wrappers.hpp"
#include "utils/ClauseReader.hpp"
#include <filesystem>
#include <vector>

namespace MapForge {

struct BuildingMesh {
  Distance distance;
  std::vector<MeshId> meshes;

  static BuildingMesh fromClause(const ClauseValue &value);
  ClauseValue toClause() const;

  bool operator==(const BuildingMesh &) const = default;
};

struct CityGroup {
  ColorIndex colorIndex;
  PixelDensity density;
  std::vector<BuildingMesh> buildings;

  static CityGroup fromClause(const ClauseValue &value);
  ClauseValue toClause() const;

  bool operator==(const CityGroup &) const = default;
};

/**
 * @brief map/cities.txt: city mesh groups painted by the cities raster
 *
 * typesSource is relative to the map root, not to the manifest.
 */
struct Cities {
  std::filesystem::path typesSource;
  PixelStep pixelStepX;
  PixelStep pixelStepY;
  std::vector<CityGroup> groups;

  static Cities fromFile(const std::filesystem::path &path);
  static Cities fromClause(const ClauseValue &document);
  ClauseValue toClause() const;

  bool operator==(const Cities &) const = default;
};

} // namespace MapForge

#endif // CITIES_HPP
