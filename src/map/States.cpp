/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/States.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include "utils/TextFile.hpp"
#include <format>

namespace MapForge {

VictoryPointEntry VictoryPointEntry::fromClause(const ClauseValue &value) {
  const auto &parts = requireArray(value, "victory_points", 2);
  return VictoryPointEntry{decodeClause<ProvinceId>(parts[0].value),
                           decodeClause<VictoryPoints>(parts[1].value)};
}

StateHistory StateHistory::fromClause(const ClauseValue &value) {
  requireObject(value, "history");
  StateHistory history;
  history.owner = requiredField<CountryTag>(value, "owner");
  history.controller = optionalField<CountryTag>(value, "controller");
  history.victoryPoints = repeatedField<VictoryPointEntry>(value, "victory_points");
  return history;
}

State State::fromClause(const ClauseValue &value) {
  requireObject(value, "state");
  State state;
  state.id = requiredField<StateId>(value, "id");
  state.name = requiredField<StateName>(value, "name");
  state.manpower = repeatedField<Manpower>(value, "manpower");
  state.categories = repeatedField<StateCategoryName>(value, "state_category");
  state.history = optionalField<StateHistory>(value, "history");
  for (const auto &province : requiredField<std::vector<ProvinceId>>(value, "provinces")) {
    state.provinces.insert(province);
  }
  state.localSupplies = optionalField<LocalSupplies>(value, "local_supplies");
  state.impassable = optionalField<bool>(value, "impassable");
  state.buildingsMaxLevelFactor =
      optionalField<BuildingsMaxLevelFactor>(value, "buildings_max_level_factor");
  return state;
}

std::optional<Manpower> State::effectiveManpower() const {
  if (manpower.empty()) {
    return std::nullopt;
  }
  return manpower.back();
}

std::optional<StateCategoryName> State::effectiveCategory() const {
  if (categories.empty()) {
    return std::nullopt;
  }
  return categories.back();
}

State States::loadFile(const std::filesystem::path &path) {
  ClauseValue document = loadClauseFile(path);
  try {
    return requiredField<State>(document, "state");
  } catch (const MapError &e) {
    throw MapError(e.code(), std::format("{}: {}", path.string(), e.what()), path);
  }
}

States States::fromDirectory(const std::filesystem::path &directory) {
  auto files = listRegularFiles(directory, "state");

  States result;
  for (const auto &file : files) {
    State state = loadFile(file);
    StateId id = state.id;
    if (result.m_states.contains(id)) {
      MAPLOADER_WARN(std::format("state {} defined again in {}", id.get(),
                                 file.string()));
    }
    result.m_states.insert_or_assign(id, std::move(state));
  }
  MAPLOADER_INFO(std::format("loaded {} states", result.size()));
  return result;
}

const State *States::find(StateId id) const {
  auto it = m_states.find(id);
  return it != m_states.end() ? &it->second : nullptr;
}

} // namespace MapForge
