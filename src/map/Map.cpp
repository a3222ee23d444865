/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Map.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include <format>

namespace MapForge {

namespace {

// Runs one sub-load, naming it in any MapError that escapes
template <typename Load> auto stage(const char *name, Load &&load) {
  try {
    return load();
  } catch (const MapError &e) {
    MAPLOADER_ERROR(std::format("{} failed: {}", name, e.what()));
    throw e.wrap(name);
  }
}

} // anonymous namespace

Map Map::load(const std::filesystem::path &root, const MapLayout &layout,
              const ImageDecoder &decoder) {
  MAPLOADER_INFO("Loading map from " + root.string());

  Map map;
  map.root = root;
  map.manifest = stage("manifest",
                       [&] { return DefaultMap::fromFile(root / layout.manifest); });
  const DefaultMap &manifest = map.manifest;

  map.terrainTypes = stage("terrain types", [&] {
    return TerrainCatalog::fromFile(root / layout.terrainTypes);
  });
  map.definitions = stage("definitions", [&] {
    return Definitions::fromFile(manifest.resolve(manifest.definitions),
                                 map.terrainTypes);
  });
  map.continents = stage("continents", [&] {
    return Continents::fromFile(manifest.resolve(manifest.continent));
  });
  map.adjacencies = stage("adjacencies", [&] {
    return Adjacencies::fromFile(manifest.resolve(manifest.adjacencies));
  });
  map.adjacencyRules = stage("adjacency rules", [&] {
    return AdjacencyRules::fromFile(manifest.resolve(manifest.adjacencyRules));
  });
  map.seasons = stage("seasons", [&] {
    return Seasons::fromFile(manifest.resolve(manifest.seasons));
  });
  map.strategicRegions = stage("strategic regions", [&] {
    return StrategicRegions::fromDirectory(root / layout.strategicRegions);
  });
  map.states = stage("states",
                     [&] { return States::fromDirectory(root / layout.states); });
  map.supplyNodes = stage("supply nodes", [&] {
    return SupplyNodes::fromFile(root / layout.supplyNodes);
  });
  map.railways = stage("railways",
                       [&] { return Railways::fromFile(root / layout.railways); });
  map.airports = stage("airports", [&] {
    return StateProvinces::fromFile(root / layout.airports);
  });
  map.rocketSites = stage("rocket sites", [&] {
    return StateProvinces::fromFile(root / layout.rocketSites);
  });
  map.buildings = stage("buildings", [&] {
    return Buildings::fromFiles(root / layout.buildingTypes, root / layout.buildings);
  });
  map.cities = stage("cities", [&] { return Cities::fromFile(root / layout.cities); });
  map.colors = stage("colors", [&] { return Colors::fromFile(root / layout.colors); });
  map.unitStacks = stage("unit stacks", [&] {
    return UnitStacks::fromFile(root / layout.unitStacks);
  });
  map.weatherPositions = stage("weather positions", [&] {
    return WeatherPositions::fromFile(root / layout.weatherPositions);
  });

  auto raster = [&](const char *name, auto locate) {
    return stage(name, [&] { return decoder.decode(locate()); });
  };
  map.provincesImage = raster("provinces image",
                              [&] { return manifest.resolve(manifest.provinces); });
  map.terrainImage = raster("terrain image",
                            [&] { return manifest.resolve(manifest.terrain); });
  map.riversImage = raster("rivers image",
                           [&] { return manifest.resolve(manifest.rivers); });
  map.heightmapImage = raster("heightmap image",
                              [&] { return manifest.resolve(manifest.heightmap); });
  map.treesImage = raster("trees image",
                          [&] { return manifest.resolve(manifest.treeDefinition); });
  map.normalMapImage = raster("normal map image",
                              [&] { return root / layout.normalMap; });
  map.citiesImage = raster("cities image",
                           [&] { return root / map.cities.typesSource; });

  MAPLOADER_INFO(std::format("Map loaded: {} provinces, {} regions, {} states",
                             map.definitions.size(), map.strategicRegions.size(),
                             map.states.size()));
  return map;
}

} // namespace MapForge
