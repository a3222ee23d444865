/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/StateProvinces.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/LineGrammar.hpp"
#include <format>

namespace MapForge {

StateProvinces StateProvinces::fromFile(const std::filesystem::path &path) {
  StateProvinces result;
  forEachContentLine(path, [&](std::string_view line, size_t lineNumber) {
    try {
      for (auto &[state, provinces] : parseIdArrayLine<StateId, ProvinceId>(line)) {
        result.m_entries.insert_or_assign(state, std::move(provinces));
      }
    } catch (const MapError &e) {
      throw MapError(e.code(),
                     std::format("{}:{}: {}", path.string(), lineNumber, e.what()),
                     path);
    }
  });
  MAPLOADER_DEBUG(std::format("{}: {} states", path.string(), result.size()));
  return result;
}

const std::vector<ProvinceId> *StateProvinces::find(StateId state) const {
  auto it = m_entries.find(state);
  return it != m_entries.end() ? &it->second : nullptr;
}

} // namespace MapForge
