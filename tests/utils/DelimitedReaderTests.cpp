/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE DelimitedReaderTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "map/Wrappers.hpp"
#include "utils/DelimitedReader.hpp"
#include "utils/ScratchDirectory.hpp"
#include "utils/TextFile.hpp"
#include <optional>
#include <string>
#include <vector>

using namespace MapForge;

struct QuietLogging {
  QuietLogging() { MAPFORGE_ENABLE_QUIET_MODE(); }
};
BOOST_GLOBAL_FIXTURE(QuietLogging);

namespace {

struct Sample {
  ProvinceId id;
  float weight{0.0f};
  std::string label;
};

Sample sampleFromRow(const DelimitedRow &row) {
  return Sample{row.get<ProvinceId>(0), row.get<float>(1), std::string(row.text(2))};
}

} // anonymous namespace

struct DelimitedFixture {
  MapForgeTest::ScratchDirectory scratch;
};

BOOST_FIXTURE_TEST_SUITE(DelimitedReaderTestSuite, DelimitedFixture)

BOOST_AUTO_TEST_CASE(TestSplitKeepsEmptyFields) {
  auto fields = splitDelimited("1;;three;", ';');
  BOOST_REQUIRE_EQUAL(fields.size(), 4);
  BOOST_CHECK_EQUAL(fields[0], "1");
  BOOST_CHECK(fields[1].empty());
  BOOST_CHECK_EQUAL(fields[2], "three");
  BOOST_CHECK(fields[3].empty());
}

BOOST_AUTO_TEST_CASE(TestStrictReadsEveryRow) {
  auto path = scratch.write("rows.csv", "1;0.5;alpha\r\n\r\n2;1.5;beta\r\n");
  DelimitedReader reader(path, {';', false, RowPolicy::Strict});
  auto rows = reader.readAll<Sample>(&sampleFromRow);

  BOOST_REQUIRE_EQUAL(rows.size(), 2);
  BOOST_CHECK_EQUAL(rows[0].id, ProvinceId(1));
  BOOST_CHECK_EQUAL(rows[1].label, "beta");
  BOOST_CHECK_EQUAL(reader.skippedRows(), 0);
}

BOOST_AUTO_TEST_CASE(TestStrictStopsAtFirstBadRow) {
  auto path = scratch.write("rows.csv", "1;0.5;alpha\nx;1.5;beta\n3;2.5;gamma\n");
  DelimitedReader reader(path, {';', false, RowPolicy::Strict});
  try {
    reader.readAll<Sample>(&sampleFromRow);
    BOOST_FAIL("expected a row error");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::CsvRow);
    BOOST_CHECK_EQUAL(e.path(), path);
    BOOST_CHECK(std::string(e.what()).find("line 2") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(TestLooseSkipsBadRows) {
  auto path = scratch.write("rows.csv", "1;0.5;alpha\nx;1.5;beta\n3\n4;2.5;delta\n");
  DelimitedReader reader(path, {';', false, RowPolicy::Loose});
  auto rows = reader.readAll<Sample>(&sampleFromRow);

  BOOST_REQUIRE_EQUAL(rows.size(), 2);
  BOOST_CHECK_EQUAL(rows[0].id, ProvinceId(1));
  BOOST_CHECK_EQUAL(rows[1].id, ProvinceId(4));
  BOOST_CHECK_EQUAL(reader.skippedRows(), 2);
}

BOOST_AUTO_TEST_CASE(TestHeaderColumnsByName) {
  auto path = scratch.write("rows.csv", "From;To;Adjacency_Rule_Name\n1;2;canal\n3;4\n");
  DelimitedReader reader(path, {';', true, RowPolicy::Strict});

  struct Link {
    ProvinceId from;
    ProvinceId to;
    std::optional<std::string> rule;
  };
  auto links = reader.readAll<Link>([](const DelimitedRow &row) {
    std::string_view rule = row.text("adjacency_rule_name");
    return Link{row.get<ProvinceId>("from"), row.get<ProvinceId>("TO"),
                rule.empty() ? std::nullopt : std::optional<std::string>(rule)};
  });

  BOOST_REQUIRE_EQUAL(reader.header().size(), 3);
  BOOST_REQUIRE_EQUAL(links.size(), 2);
  BOOST_CHECK(links[0].rule == std::optional<std::string>("canal"));
  BOOST_CHECK(!links[1].rule.has_value());
}

BOOST_AUTO_TEST_CASE(TestOptionalColumns) {
  auto path = scratch.write("rows.csv", "5;;\n");
  DelimitedReader reader(path, {';', false, RowPolicy::Strict});
  auto values = reader.readAll<std::optional<ProvinceId>>(
      [](const DelimitedRow &row) { return row.getOptional<ProvinceId>(1); });
  BOOST_REQUIRE_EQUAL(values.size(), 1);
  BOOST_CHECK(!values[0].has_value());
}

BOOST_AUTO_TEST_CASE(TestReadUntilStopsBeforeEndRow) {
  auto path = scratch.write("rows.csv", "1;0.5;alpha\n-1;\nnot;a;row\n7;2.5;late\n");
  DelimitedReader reader(path, {';', false, RowPolicy::Strict});
  auto rows = reader.readUntil<Sample>(
      [](const DelimitedRow &row) { return row.get<int32_t>(0) < 0; }, &sampleFromRow);

  BOOST_REQUIRE_EQUAL(rows.size(), 1);
  BOOST_CHECK_EQUAL(rows[0].label, "alpha");
  BOOST_CHECK_EQUAL(reader.skippedRows(), 0);
}

BOOST_AUTO_TEST_CASE(TestReadUntilWithoutEndRowReadsAll) {
  auto path = scratch.write("rows.csv", "1;0.5;alpha\n2;1.5;beta\n");
  DelimitedReader reader(path, {';', false, RowPolicy::Strict});
  auto rows = reader.readUntil<Sample>(
      [](const DelimitedRow &row) { return row.get<int32_t>(0) < 0; }, &sampleFromRow);
  BOOST_CHECK_EQUAL(rows.size(), 2);
}

BOOST_AUTO_TEST_CASE(TestMissingFile) {
  DelimitedReader reader(scratch.path() / "absent.csv", {';', false, RowPolicy::Loose});
  try {
    reader.readAll<Sample>(&sampleFromRow);
    BOOST_FAIL("expected FileNotFound");
  } catch (const MapError &e) {
    BOOST_CHECK_EQUAL(e.code(), MapErrorCode::FileNotFound);
    BOOST_CHECK_EQUAL(e.category(), MapErrorCategory::Io);
  }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TextFileTestSuite, DelimitedFixture)

BOOST_AUTO_TEST_CASE(TestLegacyTextBecomesUtf8) {
  BOOST_CHECK_EQUAL(decodeLegacyText("\xEF\xBB\xBF" "abc"), "abc");
  BOOST_CHECK_EQUAL(decodeLegacyText("S\xE3o"), "S\xC3\xA3o");
}

BOOST_AUTO_TEST_CASE(TestListRegularFilesSortedWithoutSubdirectories) {
  scratch.write("listing/b.txt", "b");
  scratch.write("listing/a.txt", "a");
  scratch.write("listing/nested/c.txt", "c");

  auto files = listRegularFiles(scratch.path() / "listing", "sample");
  BOOST_REQUIRE_EQUAL(files.size(), 2);
  BOOST_CHECK(files[0].filename() == "a.txt");
  BOOST_CHECK(files[1].filename() == "b.txt");
}

BOOST_AUTO_TEST_CASE(TestListRegularFilesMissingDirectory) {
  auto file = scratch.write("plain.txt", "x");
  for (const auto &target : {scratch.path() / "absent", file}) {
    try {
      listRegularFiles(target, "sample");
      BOOST_FAIL("expected FileNotFound");
    } catch (const MapError &e) {
      BOOST_CHECK_EQUAL(e.code(), MapErrorCode::FileNotFound);
      BOOST_CHECK(std::string(e.what()).find("sample directory not found") !=
                  std::string::npos);
    }
  }
}

BOOST_AUTO_TEST_SUITE_END()
