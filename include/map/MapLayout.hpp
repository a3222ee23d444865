/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAP_LAYOUT_HPP
#define MAP_LAYOUT_HPP

#include <filesystem>

namespace MapForge {

class SettingsManager;

/**
 * @brief Root-relative locations of the files the manifest does not name
 *
 * The defaults follow the game's own directory layout. Each can be
 * overridden from the "layout" settings category under the key shown next
 * to it.
 */
struct MapLayout {
  std::filesystem::path manifest{"map/default.map"};                     // manifest
  std::filesystem::path strategicRegions{"map/strategicregions"};        // strategic_regions
  std::filesystem::path states{"history/states"};                       // states
  std::filesystem::path supplyNodes{"map/supply_nodes.txt"};             // supply_nodes
  std::filesystem::path railways{"map/railways.txt"};                    // railways
  std::filesystem::path airports{"map/airports.txt"};                    // airports
  std::filesystem::path rocketSites{"map/rocketsites.txt"};              // rocket_sites
  std::filesystem::path buildings{"map/buildings.txt"};                  // buildings
  std::filesystem::path buildingTypes{"common/buildings/00_buildings.txt"}; // building_types
  std::filesystem::path terrainTypes{"common/terrain/00_terrain.txt"};   // terrain_types
  std::filesystem::path cities{"map/cities.txt"};                        // cities
  std::filesystem::path colors{"map/colors.txt"};                        // colors
  std::filesystem::path unitStacks{"map/unitstacks.txt"};                // unit_stacks
  std::filesystem::path weatherPositions{"map/weatherpositions.txt"};    // weather_positions
  std::filesystem::path normalMap{"map/world_normal.bmp"};               // normal_map

  static constexpr const char *SETTINGS_CATEGORY = "layout";

  // Defaults with every string setting of the layout category applied
  static MapLayout fromSettings(const SettingsManager &settings);
};

} // namespace MapForge

#endif // MAP_LAYOUT_HPP
