/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE DefinitionsTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "map/Definitions.hpp"
#include "utils/ScratchDirectory.hpp"
#include <format>
#include <string>

using namespace MapForge;

struct QuietLogging {
  QuietLogging() { MAPFORGE_ENABLE_QUIET_MODE(); }
};
BOOST_GLOBAL_FIXTURE(QuietLogging);

struct DefinitionsFixture {
  MapForgeTest::ScratchDirectory scratch;
  std::filesystem::path mapDir = MapForgeTest::fixtureMapRoot() / "map";
  std::filesystem::path terrainFile =
      MapForgeTest::fixtureMapRoot() / "common" / "terrain" / "00_terrain.txt";
};

BOOST_FIXTURE_TEST_SUITE(DefinitionsTestSuite, DefinitionsFixture)

BOOST_AUTO_TEST_CASE(TestFixtureDefinitions) {
  auto terrains = TerrainCatalog::fromFile(terrainFile);
  auto definitions = Definitions::fromFile(mapDir / "definition.csv", terrains);

  BOOST_REQUIRE_EQUAL(definitions.size(), 6);

  const Definition *ocean = definitions.find(ProvinceId(3));
  BOOST_REQUIRE(ocean != nullptr);
  BOOST_CHECK_EQUAL(ocean->type, ProvinceType::Sea);
  BOOST_CHECK(ocean->coastal.get());
  BOOST_CHECK_EQUAL(ocean->terrain.get(), "ocean");
  BOOST_CHECK_EQUAL(ocean->continent.get(), 0);

  const Definition *hills = definitions.find(ProvinceId(5));
  BOOST_REQUIRE(hills != nullptr);
  BOOST_CHECK_EQUAL(hills->r.get(), 130);
  BOOST_CHECK_EQUAL(hills->g.get(), 140);
  BOOST_CHECK_EQUAL(hills->b.get(), 150);
  BOOST_CHECK_EQUAL(hills->continent.get(), 2);

  BOOST_CHECK(definitions.find(ProvinceId(99)) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestSingleRowFields) {
  auto path = scratch.write("definition.csv", "0;0;0;0;land;false;hills;2\n");
  auto definitions = Definitions::fromFile(path);

  BOOST_REQUIRE_EQUAL(definitions.size(), 1);
  const Definition &d = definitions.definitions().front();
  BOOST_CHECK_EQUAL(d.id.get(), 0);
  BOOST_CHECK_EQUAL(d.r.get(), 0);
  BOOST_CHECK_EQUAL(d.type, ProvinceType::Land);
  BOOST_CHECK(!d.coastal.get());
  BOOST_CHECK_EQUAL(d.terrain.get(), "hills");
  BOOST_CHECK_EQUAL(d.continent.get(), 2);
}

BOOST_AUTO_TEST_CASE(TestFullSizedFile) {
  constexpr int ROWS = 17007;
  std::string content;
  content.reserve(ROWS * 32);
  for (int i = 0; i < ROWS; ++i) {
    content += std::format("{};{};{};{};land;false;plains;1\n", i, i % 256,
                           (i / 256) % 256, i / 65536);
  }
  auto definitions = Definitions::fromFile(scratch.write("definition.csv", content));

  BOOST_CHECK_EQUAL(definitions.size(), ROWS);
  BOOST_CHECK_EQUAL(definitions.definitions().back().id.get(), ROWS - 1);
}

BOOST_AUTO_TEST_CASE(TestInvalidProvinceTypeFailsLoad) {
  auto path = scratch.write("definition.csv",
                            "1;10;20;30;land;false;plains;1\n"
                            "2;40;50;60;swamp;false;plains;1\n");
  try {
    Definitions::fromFile(path);
    BOOST_FAIL("expected a row error");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::CsvRow);
    BOOST_CHECK(std::string(e.what()).find("swamp") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeColorFailsLoad) {
  auto path = scratch.write("definition.csv", "1;256;20;30;land;false;plains;1\n");
  BOOST_CHECK_THROW(Definitions::fromFile(path), MapError);
}

BOOST_AUTO_TEST_CASE(TestUnknownTerrainIsKept) {
  auto terrains = TerrainCatalog::fromFile(terrainFile);
  auto path = scratch.write("definition.csv", "7;1;2;3;land;false;glacier;1\n");
  auto definitions = Definitions::fromFile(path, terrains);
  BOOST_REQUIRE_EQUAL(definitions.size(), 1);
  BOOST_CHECK(!terrains.contains(definitions.definitions()[0].terrain));
}

BOOST_AUTO_TEST_CASE(TestTerrainCatalog) {
  auto terrains = TerrainCatalog::fromFile(terrainFile);
  BOOST_CHECK_EQUAL(terrains.size(), 6);
  BOOST_CHECK(terrains.contains(Terrain("plains")));
  BOOST_CHECK(terrains.contains(Terrain("unknown")));
  BOOST_CHECK(!terrains.contains(Terrain("desert")));
}

BOOST_AUTO_TEST_CASE(TestTerrainCatalogDuplicate) {
  auto path = scratch.write("00_terrain.txt",
                            "categories = {\n"
                            "  plains = { movement_cost = 1.0 }\n"
                            "  plains = { movement_cost = 1.2 }\n"
                            "}\n");
  try {
    TerrainCatalog::fromFile(path);
    BOOST_FAIL("expected DuplicateTerrainType");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::DuplicateTerrainType);
  }
}

BOOST_AUTO_TEST_CASE(TestTerrainCatalogWithoutBlock) {
  auto path = scratch.write("00_terrain.txt", "version = 3\n");
  try {
    TerrainCatalog::fromFile(path);
    BOOST_FAIL("expected InvalidTerrainFile");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::InvalidTerrainFile);
    BOOST_CHECK_EQUAL(e.path(), path);
  }
}

BOOST_AUTO_TEST_SUITE_END()
