/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SUPPLY_NODES_HPP
#define SUPPLY_NODES_HPP

#include "map/Wrappers.hpp"
#include <filesystem>
#include <string_view>
#include <unordered_set>

namespace MapForge {

/**
 * @brief Provinces holding a supply node, from `1 <province>` lines
 */
class SupplyNodes {
public:
  static SupplyNodes fromFile(const std::filesystem::path &path);

  /**
   * @throws MapError(InvalidSupplyNode) unless the line is exactly `1 <id>`
   */
  static ProvinceId parseLine(std::string_view line);

  bool contains(ProvinceId id) const { return m_nodes.contains(id); }
  size_t size() const { return m_nodes.size(); }
  const std::unordered_set<ProvinceId> &nodes() const { return m_nodes; }

private:
  std::unordered_set<ProvinceId> m_nodes;
};

} // namespace MapForge

#endif // SUPPLY_NODES_HPP
