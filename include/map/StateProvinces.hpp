/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STATE_PROVINCES_HPP
#define STATE_PROVINCES_HPP

#include "map/Wrappers.hpp"
#include <boost/container/flat_map.hpp>
#include <filesystem>
#include <vector>

namespace MapForge {

/**
 * @brief State id to province list, read from `<state> = { <province> ... }`
 *        lines
 *
 * Airports and rocket sites share this layout. A state listed twice keeps
 * its last line. A malformed line aborts the whole file.
 */
class StateProvinces {
public:
  using Storage = boost::container::flat_map<StateId, std::vector<ProvinceId>>;

  static StateProvinces fromFile(const std::filesystem::path &path);

  // nullptr when the state has no entry
  const std::vector<ProvinceId> *find(StateId state) const;
  size_t size() const { return m_entries.size(); }
  const Storage &entries() const { return m_entries; }

private:
  Storage m_entries;
};

using Airports = StateProvinces;
using RocketSites = StateProvinces;

} // namespace MapForge

#endif // STATE_PROVINCES_HPP
