/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AdjacencyTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "map/Adjacencies.hpp"
#include "utils/ClauseDecoder.hpp"
#include "utils/ScratchDirectory.hpp"
#include <string>

using namespace MapForge;

struct QuietLogging {
  QuietLogging() { MAPFORGE_ENABLE_QUIET_MODE(); }
};
BOOST_GLOBAL_FIXTURE(QuietLogging);

struct AdjacencyFixture {
  MapForgeTest::ScratchDirectory scratch;
  std::filesystem::path mapDir = MapForgeTest::fixtureMapRoot() / "map";
};

BOOST_FIXTURE_TEST_SUITE(AdjacencyTestSuite, AdjacencyFixture)

BOOST_AUTO_TEST_CASE(TestFixtureAdjacencies) {
  auto adjacencies = Adjacencies::fromFile(mapDir / "adjacencies.csv");
  BOOST_REQUIRE_EQUAL(adjacencies.size(), 3);

  const Adjacency &strait = adjacencies.adjacencies()[0];
  BOOST_CHECK_EQUAL(strait.from.get(), 1);
  BOOST_CHECK_EQUAL(strait.to.get(), 5);
  BOOST_CHECK(strait.type == AdjacencyType::Sea);
  BOOST_REQUIRE(strait.through.has_value());
  BOOST_CHECK_EQUAL(strait.through->get(), 3);
  BOOST_REQUIRE(strait.startX.has_value());
  BOOST_CHECK_EQUAL(strait.startX->get(), 120);
  BOOST_REQUIRE(strait.stopY.has_value());
  BOOST_CHECK_EQUAL(strait.stopY->get(), 85);
  BOOST_REQUIRE(strait.rule.has_value());
  BOOST_CHECK_EQUAL(strait.rule->get(), "TEST_STRAIT");
  BOOST_CHECK(strait.comment == std::optional<std::string>("Strait crossing"));

  const Adjacency &ford = adjacencies.adjacencies()[1];
  BOOST_CHECK(ford.type == AdjacencyType::River);
  BOOST_CHECK(!ford.through.has_value());
  BOOST_CHECK(!ford.startX.has_value());
  BOOST_CHECK(!ford.rule.has_value());

  const Adjacency &wall = adjacencies.adjacencies()[2];
  BOOST_CHECK(wall.type == AdjacencyType::Impassable);
  BOOST_CHECK(!wall.comment.has_value());
}

BOOST_AUTO_TEST_CASE(TestRowsAfterTerminatorAreIgnored) {
  auto path = scratch.write("adjacencies.csv",
                            "From;To;Type;Through;start_x;start_y;stop_x;stop_y;"
                            "adjacency_rule_name;Comment\n"
                            "1;2;;-1;-1;-1;-1;-1;;\n"
                            "-1;-1;;-1;-1;-1;-1;-1;;\n"
                            "3;4;river;-1;-1;-1;-1;-1;;\n");
  auto adjacencies = Adjacencies::fromFile(path);
  BOOST_REQUIRE_EQUAL(adjacencies.size(), 1);
  BOOST_CHECK(!adjacencies.adjacencies()[0].type.has_value());
}

BOOST_AUTO_TEST_CASE(TestShortTerminatorRow) {
  auto path = scratch.write("adjacencies.csv",
                            "From;To;Type;Through;start_x;start_y;stop_x;stop_y;"
                            "adjacency_rule_name;Comment\n"
                            "1;2;;-1;-1;-1;-1;-1;;\n"
                            "-1;\n");
  auto adjacencies = Adjacencies::fromFile(path);
  BOOST_REQUIRE_EQUAL(adjacencies.size(), 1);
  BOOST_CHECK_EQUAL(adjacencies.adjacencies()[0].to.get(), 2);
}

BOOST_AUTO_TEST_CASE(TestFreeTextAfterTerminatorIsNotDecoded) {
  auto path = scratch.write("adjacencies.csv",
                            "From;To;Type;Through;start_x;start_y;stop_x;stop_y;"
                            "adjacency_rule_name;Comment\n"
                            "1;2;;-1;-1;-1;-1;-1;;\n"
                            "-1;-1;;-1;-1;-1;-1;-1;;\n"
                            "end of data notes\n"
                            "5;tunnel;x\n");
  auto adjacencies = Adjacencies::fromFile(path);
  BOOST_CHECK_EQUAL(adjacencies.size(), 1);
}

BOOST_AUTO_TEST_CASE(TestBadRowBeforeTerminatorStillFails) {
  auto path = scratch.write("adjacencies.csv",
                            "From;To;Type;Through;start_x;start_y;stop_x;stop_y;"
                            "adjacency_rule_name;Comment\n"
                            "not a row\n"
                            "-1;\n");
  try {
    Adjacencies::fromFile(path);
    BOOST_FAIL("expected a row error");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::CsvRow);
    BOOST_CHECK(std::string(e.what()).find("line 2") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(TestUnknownTypeFailsLoad) {
  auto path = scratch.write("adjacencies.csv",
                            "From;To;Type;Through;start_x;start_y;stop_x;stop_y;"
                            "adjacency_rule_name;Comment\n"
                            "1;2;tunnel;-1;-1;-1;-1;-1;;\n");
  try {
    Adjacencies::fromFile(path);
    BOOST_FAIL("expected a row error");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::CsvRow);
  }
}

BOOST_AUTO_TEST_CASE(TestTypeParsing) {
  BOOST_CHECK(parseAdjacencyType("large_river") == AdjacencyType::LargeRiver);
  BOOST_CHECK(!parseAdjacencyType("").has_value());
  BOOST_CHECK_THROW(parseAdjacencyType("bridge"), MapError);
  BOOST_CHECK_EQUAL(std::string(toString(AdjacencyType::Impassable)), "impassable");
}

BOOST_AUTO_TEST_CASE(TestFixtureRules) {
  auto rules = AdjacencyRules::fromFile(mapDir / "adjacency_rules.txt");
  BOOST_REQUIRE_EQUAL(rules.size(), 1);

  const AdjacencyRule *strait = rules.find(AdjacencyRuleName("TEST_STRAIT"));
  BOOST_REQUIRE(strait != nullptr);
  BOOST_CHECK(strait->friendly.army && strait->friendly.trade);
  BOOST_CHECK(!strait->contested.army && !strait->contested.submarine);
  BOOST_CHECK(strait->enemy.submarine);
  BOOST_CHECK(!strait->enemy.army);
  BOOST_CHECK(!strait->neutral.army);
  BOOST_CHECK(strait->neutral.navy);
  BOOST_REQUIRE_EQUAL(strait->requiredProvinces.size(), 2);
  BOOST_CHECK_EQUAL(strait->requiredProvinces[1].get(), 5);
  BOOST_CHECK_EQUAL(strait->icon.get(), 1);
  BOOST_CHECK_EQUAL(strait->offset[0], -3);
  BOOST_CHECK_EQUAL(strait->offset[2], 2);
  BOOST_REQUIRE(strait->disabledTooltip.has_value());
  BOOST_CHECK_EQUAL(strait->disabledTooltip->get(), "strait_blocked_tt");
}

BOOST_AUTO_TEST_CASE(TestRuleSurvivesRewrite) {
  auto rules = AdjacencyRules::fromFile(mapDir / "adjacency_rules.txt");
  const AdjacencyRule &original = rules.rules().begin()->second;

  ClauseValue document = ClauseValue::block();
  document.add("adjacency_rule", original.toClause());
  auto reparsed =
      AdjacencyRules::fromClause(parseClauseText(document.toDocument(), "rewrite"));

  const AdjacencyRule *copy = reparsed.find(original.name);
  BOOST_REQUIRE(copy != nullptr);
  BOOST_CHECK(*copy == original);
}

BOOST_AUTO_TEST_CASE(TestLaterRuleReplacesEarlier) {
  const char *logic = "{ army = yes navy = yes submarine = yes trade = yes }";
  std::string rule = std::string("contested = ") + logic + " enemy = " + logic +
                     " friend = " + logic + " neutral = " + logic +
                     " required_provinces = { } offset = { 0 0 0 }";
  auto document = parseClauseText(
      "adjacency_rule = { name = CANAL icon = 1 " + rule + " }\n"
      "adjacency_rule = { name = CANAL icon = 9 " + rule + " }\n",
      "rules");
  auto rules = AdjacencyRules::fromClause(document);
  BOOST_REQUIRE_EQUAL(rules.size(), 1);
  BOOST_CHECK_EQUAL(rules.find(AdjacencyRuleName("CANAL"))->icon.get(), 9);
  BOOST_CHECK(!rules.find(AdjacencyRuleName("CANAL"))->disabledTooltip.has_value());
}

BOOST_AUTO_TEST_CASE(TestRuleMissingLogicNamesKey) {
  auto document = parseClauseText(
      "adjacency_rule = { name = BROKEN icon = 1 offset = { 0 0 0 }"
      " required_provinces = { } }\n",
      "rules");
  try {
    AdjacencyRules::fromClause(document);
    BOOST_FAIL("expected a decode error");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::Decode);
    BOOST_CHECK(std::string(e.what()).find("contested") != std::string::npos);
  }
}

BOOST_AUTO_TEST_SUITE_END()
