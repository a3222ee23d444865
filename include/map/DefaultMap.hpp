/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEFAULT_MAP_HPP
#define DEFAULT_MAP_HPP

#include "utils/ClauseReader.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace MapForge {

/**
 * @brief The map manifest (map/default.map)
 *
 * Every path is stored exactly as written, relative to the manifest's own
 * directory. Use resolve() to turn one into a usable path.
 */
class DefaultMap {
public:
  std::filesystem::path definitions;
  std::filesystem::path provinces;
  std::filesystem::path positions;
  std::filesystem::path terrain;
  std::filesystem::path rivers;
  std::filesystem::path heightmap;
  std::filesystem::path treeDefinition;
  std::filesystem::path continent;
  std::filesystem::path adjacencyRules;
  std::filesystem::path adjacencies;
  std::optional<std::filesystem::path> climate;
  std::filesystem::path ambientObject;
  std::filesystem::path seasons;
  // Palette indices of trees.bmp that hold trees
  std::vector<size_t> tree;

  static DefaultMap fromFile(const std::filesystem::path &manifestPath);
  // manifestPath is the file the document came from; resolve() needs it
  static DefaultMap fromClause(const ClauseValue &document,
                               std::filesystem::path manifestPath = {});
  ClauseValue toClause() const;

  /**
   * @brief Joins a stored relative path onto the manifest's directory
   * @throws MapError(FileNotFound) on the manifest path when it has no parent
   *         directory or no file name
   */
  std::filesystem::path resolve(const std::filesystem::path &relative) const;

  const std::filesystem::path &manifestPath() const { return m_manifestPath; }

  bool operator==(const DefaultMap &) const = default;

private:
  std::filesystem::path m_manifestPath;
};

} // namespace MapForge

#endif // DEFAULT_MAP_HPP
