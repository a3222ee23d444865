/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/DefaultMap.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include <format>

namespace MapForge {

DefaultMap DefaultMap::fromFile(const std::filesystem::path &manifestPath) {
  DefaultMap map;
  try {
    map = fromClause(loadClauseFile(manifestPath), manifestPath);
  } catch (const MapError &e) {
    if (e.path().empty()) {
      throw MapError(e.code(),
                     std::format("{}: {}", manifestPath.string(), e.what()),
                     manifestPath);
    }
    throw;
  }
  MAPLOADER_DEBUG(std::format("manifest {} names {} tree indices",
                              manifestPath.string(), map.tree.size()));
  return map;
}

DefaultMap DefaultMap::fromClause(const ClauseValue &document,
                                  std::filesystem::path manifestPath) {
  using std::filesystem::path;
  DefaultMap map;
  map.m_manifestPath = std::move(manifestPath);
  map.definitions = requiredField<path>(document, "definitions");
  map.provinces = requiredField<path>(document, "provinces");
  map.positions = requiredField<path>(document, "positions");
  map.terrain = requiredField<path>(document, "terrain");
  map.rivers = requiredField<path>(document, "rivers");
  map.heightmap = requiredField<path>(document, "heightmap");
  map.treeDefinition = requiredField<path>(document, "tree_definition");
  map.continent = requiredField<path>(document, "continent");
  map.adjacencyRules = requiredField<path>(document, "adjacency_rules");
  map.adjacencies = requiredField<path>(document, "adjacencies");
  map.climate = optionalField<path>(document, "climate");
  map.ambientObject = requiredField<path>(document, "ambient_object");
  map.seasons = requiredField<path>(document, "seasons");
  map.tree = requiredField<std::vector<size_t>>(document, "tree");
  return map;
}

ClauseValue DefaultMap::toClause() const {
  ClauseValue document = ClauseValue::block();
  putField(document, "definitions", definitions);
  putField(document, "provinces", provinces);
  putField(document, "positions", positions);
  putField(document, "terrain", terrain);
  putField(document, "rivers", rivers);
  putField(document, "heightmap", heightmap);
  putField(document, "tree_definition", treeDefinition);
  putField(document, "continent", continent);
  putField(document, "adjacency_rules", adjacencyRules);
  putField(document, "adjacencies", adjacencies);
  putField(document, "climate", climate);
  putField(document, "ambient_object", ambientObject);
  putField(document, "seasons", seasons);
  putField(document, "tree", tree);
  return document;
}

std::filesystem::path
DefaultMap::resolve(const std::filesystem::path &relative) const {
  std::filesystem::path fileName = m_manifestPath.filename();
  if (!m_manifestPath.has_parent_path() || fileName.empty() || fileName == "." ||
      fileName == "..") {
    throw MapError(MapErrorCode::FileNotFound,
                   std::format("manifest path '{}' has no directory or file name",
                               m_manifestPath.string()),
                   m_manifestPath);
  }
  return m_manifestPath.parent_path() / relative;
}

} // namespace MapForge
