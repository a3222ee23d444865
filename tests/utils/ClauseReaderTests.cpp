/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ClauseReaderTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "map/DayMonth.hpp"
#include "map/Wrappers.hpp"
#include "utils/ClauseDecoder.hpp"
#include "utils/ClauseReader.hpp"
#include "utils/ScratchDirectory.hpp"
#include <string>
#include <vector>

using namespace MapForge;

struct QuietLogging {
  QuietLogging() { MAPFORGE_ENABLE_QUIET_MODE(); }
};
BOOST_GLOBAL_FIXTURE(QuietLogging);

BOOST_AUTO_TEST_SUITE(ClauseReaderParsing)

BOOST_AUTO_TEST_CASE(TestScalarsAndBlocks) {
  ClauseReader reader;
  BOOST_REQUIRE(reader.parse("id = 42\nname = \"North Sea\"\nprovinces = { 1 2 3 }\n"));

  const ClauseValue &root = reader.getRoot();
  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root.size(), 3);
  BOOST_CHECK_EQUAL(root.findLast("id")->asScalar(), "42");
  BOOST_CHECK_EQUAL(root.findLast("name")->asScalar(), "North Sea");
  BOOST_CHECK(root.findLast("name")->isQuoted());

  const ClauseValue *provinces = root.findLast("provinces");
  BOOST_REQUIRE(provinces != nullptr);
  BOOST_CHECK(provinces->isArray());
  BOOST_CHECK_EQUAL(provinces->size(), 3);
  BOOST_CHECK_EQUAL(provinces->entries()[2].value.asScalar(), "3");
}

BOOST_AUTO_TEST_CASE(TestCommentsAndEscapes) {
  ClauseReader reader;
  BOOST_REQUIRE(reader.parse("# header comment\n"
                             "tooltip = \"say \\\"hi\\\"\" # trailing\n"
                             "path = \"a\\\\b\"\n"));
  BOOST_CHECK_EQUAL(reader.getRoot().findLast("tooltip")->asScalar(), "say \"hi\"");
  BOOST_CHECK_EQUAL(reader.getRoot().findLast("path")->asScalar(), "a\\b");
}

BOOST_AUTO_TEST_CASE(TestOperatorsAreTokenized) {
  ClauseReader reader;
  BOOST_REQUIRE(reader.parse("a < 1 b <= 2 c > 3 d >= 4 e != 5 f ?= 6 g == 7 h = 8"));

  const auto &entries = reader.getRoot().entries();
  BOOST_REQUIRE_EQUAL(entries.size(), 8);
  BOOST_CHECK_EQUAL(entries[0].op, ClauseOperator::Less);
  BOOST_CHECK_EQUAL(entries[1].op, ClauseOperator::LessEqual);
  BOOST_CHECK_EQUAL(entries[2].op, ClauseOperator::Greater);
  BOOST_CHECK_EQUAL(entries[3].op, ClauseOperator::GreaterEqual);
  BOOST_CHECK_EQUAL(entries[4].op, ClauseOperator::NotEqual);
  BOOST_CHECK_EQUAL(entries[5].op, ClauseOperator::Exists);
  BOOST_CHECK_EQUAL(entries[6].op, ClauseOperator::EqualEqual);
  BOOST_CHECK_EQUAL(entries[7].op, ClauseOperator::Equal);
}

BOOST_AUTO_TEST_CASE(TestTaggedColorBlock) {
  ClauseReader reader;
  BOOST_REQUIRE(reader.parse("color = rgb { 4 144 178 }\nhsv_north = hsv { 0.0 0.4 0.7 }"));
  const ClauseValue *color = reader.getRoot().findLast("color");
  BOOST_REQUIRE(color != nullptr);
  BOOST_CHECK(color->isArray());
  BOOST_CHECK_EQUAL(color->size(), 3);
  BOOST_CHECK_EQUAL(reader.getRoot().findLast("hsv_north")->size(), 3);
}

BOOST_AUTO_TEST_CASE(TestLegacyBytesAndBom) {
  MapForgeTest::ScratchDirectory scratch;
  // UTF-8 BOM, then "name = Düsseldorf" with the umlaut as a single latin-1 byte
  auto path = scratch.write("city.txt", std::string("\xEF\xBB\xBFname = D\xFCsseldorf\n"));

  ClauseReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path));
  BOOST_CHECK_EQUAL(reader.getRoot().findLast("name")->asScalar(), "D\xC3\xBCsseldorf");
}

BOOST_AUTO_TEST_CASE(TestSyntaxErrors) {
  ClauseReader reader;
  BOOST_CHECK(!reader.parse("weather = { period = { between = { 0.0 30.0 } }"));
  BOOST_CHECK(reader.getLastError().find("Line") != std::string::npos);

  BOOST_CHECK(!reader.parse("a = 1 }"));
  BOOST_CHECK(!reader.parse("name = \"unterminated"));
  BOOST_CHECK(!reader.loadFromFile("/nonexistent/file.txt"));
}

BOOST_AUTO_TEST_CASE(TestWriterRoundTrip) {
  ClauseReader reader;
  BOOST_REQUIRE(reader.parse("a = { b = \"two words\" c = { 1 2 } d = { e = yes } }\nf = 3"));

  std::string written = reader.getRoot().toDocument();
  ClauseReader again;
  BOOST_REQUIRE_MESSAGE(again.parse(written), again.getLastError());
  BOOST_CHECK(again.getRoot() == reader.getRoot());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ClauseDecoding)

BOOST_AUTO_TEST_CASE(TestRepeatPolicy) {
  ClauseValue document = parseClauseText("manpower = 100\n"
                                         "manpower = 250\n"
                                         "category = town\n"
                                         "category = city\n",
                                         "test");

  // Append keeps every occurrence in file order
  auto all = repeatedField<Manpower>(document, "manpower");
  BOOST_REQUIRE_EQUAL(all.size(), 2);
  BOOST_CHECK_EQUAL(all[0], Manpower(100));
  BOOST_CHECK_EQUAL(all[1], Manpower(250));

  // Replace keeps the last one
  BOOST_CHECK_EQUAL(requiredField<StateCategoryName>(document, "category"),
                    StateCategoryName("city"));
  BOOST_CHECK_EQUAL(collectField(document, "category", OnRepeat::Replace).size(), 1);
  BOOST_CHECK_EQUAL(collectField(document, "category", OnRepeat::Append).size(), 2);

  BOOST_CHECK(repeatedField<Manpower>(document, "absent").empty());
}

BOOST_AUTO_TEST_CASE(TestMissingKeyAndUnknownKeys) {
  ClauseValue document = parseClauseText("id = 3\nunrelated = { x = 1 }", "test");

  BOOST_CHECK_EQUAL(requiredField<StateId>(document, "id"), StateId(3));
  BOOST_CHECK(!optionalField<StateName>(document, "name").has_value());

  try {
    requiredField<StateName>(document, "name");
    BOOST_FAIL("expected a decode error");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::Decode);
    BOOST_CHECK_EQUAL(e.category(), MapErrorCategory::Decode);
    BOOST_CHECK(std::string(e.what()).find("name") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(TestNestedErrorsNameTheKey) {
  ClauseValue document = parseClauseText("provinces = { 1 two 3 }", "test");
  try {
    requiredField<std::vector<ProvinceId>>(document, "provinces");
    BOOST_FAIL("expected an invalid scalar");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::InvalidScalar);
    BOOST_CHECK(std::string(e.what()).starts_with("provinces: "));
  }
}

BOOST_AUTO_TEST_CASE(TestShapeChecks) {
  ClauseValue document = parseClauseText("offset = { 1 2 }\nname = x", "test");
  BOOST_CHECK_THROW(requireArray(*document.findLast("offset"), "offset", 3), MapError);
  BOOST_CHECK_THROW(requireObject(*document.findLast("name"), "name"), MapError);
  BOOST_CHECK_THROW(requiredField<std::vector<ProvinceId>>(document, "name"), MapError);
  BOOST_CHECK_THROW(parseClauseText("a = {", "broken"), MapError);
}

BOOST_AUTO_TEST_CASE(TestFirstBlockKeys) {
  auto keys = firstBlockKeys(parseClauseText("buildings = { infrastructure = { } arms_factory = { } }\n"
                                             "other = { x = { } }",
                                             "test"));
  BOOST_REQUIRE(keys.has_value());
  BOOST_REQUIRE_EQUAL(keys->size(), 2);
  BOOST_CHECK_EQUAL((*keys)[0], "infrastructure");
  BOOST_CHECK_EQUAL((*keys)[1], "arms_factory");

  BOOST_CHECK(!firstBlockKeys(parseClauseText("version = 3", "test")).has_value());
  BOOST_CHECK(!firstBlockKeys(parseClauseText("", "test")).has_value());
}

BOOST_AUTO_TEST_SUITE_END()
