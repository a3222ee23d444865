/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STATES_HPP
#define STATES_HPP

#include "map/Wrappers.hpp"
#include "utils/ClauseReader.hpp"
#include <filesystem>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace MapForge {

// `victory_points = { <province> <points> }`
struct VictoryPointEntry {
  ProvinceId province;
  VictoryPoints points;

  static VictoryPointEntry fromClause(const ClauseValue &value);

  bool operator==(const VictoryPointEntry &) const = default;
};

struct StateHistory {
  CountryTag owner;
  std::optional<CountryTag> controller;
  std::vector<VictoryPointEntry> victoryPoints;

  static StateHistory fromClause(const ClauseValue &value);
};

/**
 * @brief One `state = { ... }` block of history/states
 *
 * manpower and state_category may repeat; every occurrence is kept and the
 * last one is the effective value.
 */
struct State {
  StateId id;
  StateName name;
  std::vector<Manpower> manpower;
  std::vector<StateCategoryName> categories;
  std::optional<StateHistory> history;
  std::unordered_set<ProvinceId> provinces;
  std::optional<LocalSupplies> localSupplies;
  std::optional<bool> impassable;
  std::optional<BuildingsMaxLevelFactor> buildingsMaxLevelFactor;

  static State fromClause(const ClauseValue &value);

  std::optional<Manpower> effectiveManpower() const;
  std::optional<StateCategoryName> effectiveCategory() const;
};

class States {
public:
  /**
   * @brief Loads every file of the directory, in file name order
   *
   * A state id defined twice keeps the later file, with a warning.
   */
  static States fromDirectory(const std::filesystem::path &directory);
  static State loadFile(const std::filesystem::path &path);

  const State *find(StateId id) const;
  size_t size() const { return m_states.size(); }
  const std::unordered_map<StateId, State> &states() const { return m_states; }

private:
  std::unordered_map<StateId, State> m_states;
};

} // namespace MapForge

#endif // STATES_HPP
