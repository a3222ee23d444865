/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Palette.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include <format>

namespace MapForge {

namespace {

template <typename Catalog>
Catalog loadCatalog(const std::filesystem::path &path) {
  try {
    return Catalog::fromClause(loadClauseFile(path));
  } catch (const MapError &e) {
    if (e.path().empty()) {
      throw MapError(e.code(), std::format("{}: {}", path.string(), e.what()), path);
    }
    throw;
  }
}

} // anonymous namespace

Continents Continents::fromFile(const std::filesystem::path &path) {
  return loadCatalog<Continents>(path);
}

Continents Continents::fromClause(const ClauseValue &document) {
  Continents result;
  result.m_names = requiredField<std::vector<Continent>>(document, "continents");
  MAPLOADER_DEBUG(std::format("{} continents", result.size()));
  return result;
}

const Continent *Continents::byIndex(ContinentIndex index) const {
  if (index.get() < 1 || static_cast<size_t>(index.get()) > m_names.size()) {
    return nullptr;
  }
  return &m_names[static_cast<size_t>(index.get()) - 1];
}

Color Color::fromClause(const ClauseValue &value) {
  const auto &parts = requireArray(value, "color", 3);
  return Color{decodeClause<Red>(parts[0].value),
               decodeClause<Green>(parts[1].value),
               decodeClause<Blue>(parts[2].value)};
}

ClauseValue Color::toClause() const {
  ClauseValue block = ClauseValue::block();
  block.push(encodeClause(red));
  block.push(encodeClause(green));
  block.push(encodeClause(blue));
  return block;
}

std::ostream &operator<<(std::ostream &os, const Color &color) {
  return os << "Color(" << static_cast<unsigned>(color.red.get()) << ", "
            << static_cast<unsigned>(color.green.get()) << ", "
            << static_cast<unsigned>(color.blue.get()) << ')';
}

Colors Colors::fromFile(const std::filesystem::path &path) {
  return loadCatalog<Colors>(path);
}

Colors Colors::fromClause(const ClauseValue &document) {
  Colors result;
  result.m_colors = repeatedField<Color>(document, "color");
  return result;
}

} // namespace MapForge
