/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAILWAYS_HPP
#define RAILWAYS_HPP

#include "map/Wrappers.hpp"
#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

namespace MapForge {

/**
 * @brief One railway line: `<level> <length> <province> ...`
 */
struct Railway {
  RailLevel level;
  RailLength length;
  std::vector<ProvinceId> provinces;

  /**
   * @throws MapError(InvalidRailway) when the line is short, level or length
   *         do not parse, or length differs from the number of provinces
   */
  static Railway parse(std::string_view line);

  bool operator==(const Railway &) const = default;
};

std::ostream &operator<<(std::ostream &os, const Railway &railway);

class Railways {
public:
  // Any invalid line aborts the load
  static Railways fromFile(const std::filesystem::path &path);

  const std::vector<Railway> &railways() const { return m_railways; }
  size_t size() const { return m_railways.size(); }

private:
  std::vector<Railway> m_railways;
};

} // namespace MapForge

#endif // RAILWAYS_HPP
