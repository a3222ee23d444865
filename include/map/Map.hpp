/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAP_HPP
#define MAP_HPP

#include "map/Adjacencies.hpp"
#include "map/Buildings.hpp"
#include "map/Cities.hpp"
#include "map/DefaultMap.hpp"
#include "map/Definitions.hpp"
#include "map/MapLayout.hpp"
#include "map/Palette.hpp"
#include "map/Placements.hpp"
#include "map/Railways.hpp"
#include "map/Seasons.hpp"
#include "map/StateProvinces.hpp"
#include "map/States.hpp"
#include "map/StrategicRegions.hpp"
#include "map/SupplyNodes.hpp"
#include "utils/ImageDecoder.hpp"
#include <filesystem>

namespace MapForge {

/**
 * @brief Every catalog and raster of one map directory
 *
 * Built in one go by load(); nothing is changed afterwards.
 */
struct Map {
  std::filesystem::path root;
  DefaultMap manifest;

  TerrainCatalog terrainTypes;
  Definitions definitions;
  Continents continents;
  Adjacencies adjacencies;
  AdjacencyRules adjacencyRules;
  Seasons seasons;
  StrategicRegions strategicRegions;
  States states;
  SupplyNodes supplyNodes;
  Railways railways;
  Airports airports;
  RocketSites rocketSites;
  Buildings buildings;
  Cities cities;
  Colors colors;
  UnitStacks unitStacks;
  WeatherPositions weatherPositions;

  RgbImage provincesImage;
  RgbImage terrainImage;
  RgbImage riversImage;
  RgbImage heightmapImage;
  RgbImage treesImage;
  RgbImage normalMapImage;
  RgbImage citiesImage;

  /**
   * @brief Loads the manifest, then every catalog, then every raster
   *
   * Stops at the first failure. The error keeps its code and gains the name
   * of the failing part, e.g. "strategic regions: ...".
   */
  static Map load(const std::filesystem::path &root, const MapLayout &layout,
                  const ImageDecoder &decoder);
};

} // namespace MapForge

#endif // MAP_HPP
