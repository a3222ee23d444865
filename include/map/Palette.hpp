/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PALETTE_HPP
#define PALETTE_HPP

#include "map/Wrappers.hpp"
#include "utils/ClauseReader.hpp"
#include <filesystem>
#include <ostream>
#include <vector>

namespace MapForge {

/**
 * @brief Continent names from `continents = { ... }`
 *
 * Definition continent index N refers to entry N-1; index 0 is the sea.
 */
class Continents {
public:
  static Continents fromFile(const std::filesystem::path &path);
  static Continents fromClause(const ClauseValue &document);

  // nullptr for index 0 and for indices past the end
  const Continent *byIndex(ContinentIndex index) const;
  size_t size() const { return m_names.size(); }
  const std::vector<Continent> &names() const { return m_names; }

private:
  std::vector<Continent> m_names;
};

struct Color {
  Red red;
  Green green;
  Blue blue;

  static Color fromClause(const ClauseValue &value);
  ClauseValue toClause() const;

  bool operator==(const Color &) const = default;
};

std::ostream &operator<<(std::ostream &os, const Color &color);

/**
 * @brief map/colors.txt: ordered `color = { r g b }` entries
 */
class Colors {
public:
  static Colors fromFile(const std::filesystem::path &path);
  static Colors fromClause(const ClauseValue &document);

  size_t size() const { return m_colors.size(); }
  const std::vector<Color> &colors() const { return m_colors; }

private:
  std::vector<Color> m_colors;
};

} // namespace MapForge

#endif // PALETTE_HPP
