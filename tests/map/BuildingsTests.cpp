/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE BuildingsTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "map/Buildings.hpp"
#include "utils/ScratchDirectory.hpp"
#include <algorithm>
#include <string>

using namespace MapForge;

struct QuietLogging {
  QuietLogging() { MAPFORGE_ENABLE_QUIET_MODE(); }
};
BOOST_GLOBAL_FIXTURE(QuietLogging);

struct BuildingsFixture {
  MapForgeTest::ScratchDirectory scratch;
  std::filesystem::path root = MapForgeTest::fixtureMapRoot();
  std::filesystem::path typesFile = root / "common" / "buildings" / "00_buildings.txt";
  std::filesystem::path placementsFile = root / "map" / "buildings.txt";

  static bool hasBuilding(const Buildings &buildings, const std::string &id) {
    return std::any_of(buildings.buildings().begin(), buildings.buildings().end(),
                       [&](const StateBuilding &b) { return b.building.get() == id; });
  }
};

BOOST_FIXTURE_TEST_SUITE(BuildingsTestSuite, BuildingsFixture)

BOOST_AUTO_TEST_CASE(TestDeclaredTypes) {
  auto types = Buildings::loadTypes(typesFile);
  BOOST_CHECK_EQUAL(types.size(), 4);
  BOOST_CHECK(types.contains(BuildingId("infrastructure")));
  BOOST_CHECK(types.contains(BuildingId("naval_base")));
  BOOST_CHECK(types.contains(BuildingId(Buildings::IMPLICIT_TYPE)));
}

BOOST_AUTO_TEST_CASE(TestFixturePlacements) {
  auto buildings = Buildings::fromFiles(typesFile, placementsFile);

  BOOST_CHECK_EQUAL(buildings.size(), 4);
  BOOST_CHECK_EQUAL(buildings.droppedCount(), 1);
  BOOST_CHECK_EQUAL(buildings.skippedRows(), 1);
  BOOST_CHECK(hasBuilding(buildings, "floating_harbor"));
  BOOST_CHECK(!hasBuilding(buildings, "mystery_works"));

  const StateBuilding &factory = buildings.buildings().front();
  BOOST_CHECK_EQUAL(factory.state.get(), 1);
  BOOST_CHECK_CLOSE(factory.x, 1672.0f, 0.001f);
  BOOST_CHECK_CLOSE(factory.rotation, -3.93f, 0.001f);
  BOOST_CHECK_EQUAL(factory.adjacentSeaProvince.get(), 0);

  const StateBuilding &infrastructure = buildings.buildings()[1];
  BOOST_CHECK_EQUAL(infrastructure.building.get(), "infrastructure");
  BOOST_CHECK_EQUAL(infrastructure.adjacentSeaProvince.get(), 0);

  BOOST_CHECK_EQUAL(buildings.buildings()[2].adjacentSeaProvince.get(), 3);
}

BOOST_AUTO_TEST_CASE(TestMissingAdjacentColumn) {
  auto path = scratch.write("buildings.txt", "4;arms_factory;1.0;2.0;3.0;0.5\n");
  auto buildings = Buildings::fromFiles(typesFile, path);
  BOOST_REQUIRE_EQUAL(buildings.size(), 1);
  BOOST_CHECK_EQUAL(buildings.buildings()[0].adjacentSeaProvince.get(), 0);
}

BOOST_AUTO_TEST_CASE(TestTypesWithoutBlock) {
  auto path = scratch.write("00_buildings.txt", "# nothing declared\nversion = 1\n");
  try {
    Buildings::loadTypes(path);
    BOOST_FAIL("expected InvalidBuildingsFile");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::InvalidBuildingsFile);
  }
}

BOOST_AUTO_TEST_CASE(TestDuplicateType) {
  auto path = scratch.write("00_buildings.txt",
                            "buildings = {\n"
                            "  bunker = { base_cost = 500 }\n"
                            "  bunker = { base_cost = 800 }\n"
                            "}\n");
  try {
    Buildings::loadTypes(path);
    BOOST_FAIL("expected DuplicateBuildingType");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::DuplicateBuildingType);
    BOOST_CHECK(std::string(e.what()).find("bunker") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(TestMissingPlacementsFile) {
  try {
    Buildings::fromFiles(typesFile, scratch.path() / "buildings.txt");
    BOOST_FAIL("expected FileNotFound");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::FileNotFound);
  }
}

BOOST_AUTO_TEST_SUITE_END()
