/**
 * @file csv_test.cpp
 * @brief Tests for the Csv iterator engine.
 */

#include "lazycsv/csv.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

using namespace lazycsv;
using lazycsv_test::collectRows;
using lazycsv_test::itemTrace;
using lazycsv_test::Rows;

class CsvTest : public ::testing::Test {
protected:
  std::string getTestDataPath(const std::string& filename) { return "test/data/" + filename; }
};

// ============================================================================
// ITEM SEQUENCE
// ============================================================================

TEST_F(CsvTest, CellsThenRowEndPerRow) {
  std::vector<std::string> expected = {"a", "b", "c", "|", "1", "2", "3", "|"};
  EXPECT_EQ(itemTrace("a,b,c\n1,2,3"), expected);
}

TEST_F(CsvTest, TrailingNewlineDoesNotAddRow) {
  EXPECT_EQ(itemTrace("a,b,c\n1,2,3\n"), itemTrace("a,b,c\n1,2,3"));
}

TEST_F(CsvTest, EmptyBufferYieldsNothing) {
  Csv csv("");
  CsvItem item;
  EXPECT_TRUE(csv.done());
  EXPECT_FALSE(csv.next(item));
  EXPECT_FALSE(csv.failed());
  EXPECT_EQ(csv.error(), nullptr);
}

TEST_F(CsvTest, SingleNewlineIsOneEmptyRow) {
  std::vector<std::string> expected = {"", "|"};
  EXPECT_EQ(itemTrace("\n"), expected);
}

TEST_F(CsvTest, BlankLineInTheMiddle) {
  std::vector<std::string> expected = {"a", "|", "", "|", "b", "|"};
  EXPECT_EQ(itemTrace("a\n\nb\n"), expected);
}

TEST_F(CsvTest, TrailingSeparatorYieldsFinalEmptyCell) {
  std::vector<std::string> expected = {"a", "b", "", "|"};
  EXPECT_EQ(itemTrace("a,b,"), expected);
  EXPECT_EQ(itemTrace("a,b,\n"), expected);
}

TEST_F(CsvTest, QuotedSeparatorStaysInCell) {
  Rows expected = {{"a,b", "c"}};
  EXPECT_EQ(collectRows("\"a,b\",c"), expected);
}

TEST_F(CsvTest, QuotedNewlineStaysInCell) {
  Rows expected = {{"x\ny", "z"}};
  EXPECT_EQ(collectRows("\"x\ny\",z\n"), expected);
}

TEST_F(CsvTest, CrLfRowsDecodeWithoutCarriageReturn) {
  Rows expected = {{"a", "b"}, {"1", "2"}};
  EXPECT_EQ(collectRows("a,b\r\n1,2\r\n"), expected);
}

TEST_F(CsvTest, MixedLineEndings) {
  Rows expected = {{"a"}, {"b"}, {"c"}};
  EXPECT_EQ(collectRows("a\r\nb\nc"), expected);
}

TEST_F(CsvTest, RaggedRowsAreFineForTheEngine) {
  Rows expected = {{"a", "b", "c"}, {"1"}, {"2", "3"}};
  EXPECT_EQ(collectRows("a,b,c\n1\n2,3\n"), expected);
}

TEST_F(CsvTest, TabDialect) {
  Rows expected = {{"a", "b,c"}, {"1", "2"}};
  EXPECT_EQ(collectRows("a\tb,c\n1\t2\n", Dialect::tsv()), expected);
}

TEST_F(CsvTest, InvalidDialectThrows) {
  EXPECT_THROW(Csv("a", Dialect{'"'}), std::invalid_argument);
  EXPECT_THROW(Csv("a", Dialect{'\n'}), std::invalid_argument);
  EXPECT_THROW(Csv("a", Dialect{'\r'}), std::invalid_argument);
}

TEST_F(CsvTest, RejectsTemporaryStrings) {
  EXPECT_FALSE((std::is_constructible<Csv, std::string&&>::value));
  EXPECT_FALSE((std::is_constructible<Csv, std::string&&, const Dialect&>::value));
  EXPECT_TRUE((std::is_constructible<Csv, std::string&>::value));
  EXPECT_TRUE((std::is_constructible<Csv, const std::string&>::value));
  EXPECT_TRUE((std::is_constructible<Csv, std::string_view>::value));
  EXPECT_TRUE((std::is_constructible<Csv, const char*>::value));
}

TEST_F(CsvTest, CellsPointIntoTheBuffer) {
  std::string data = "ab,\"cd\"\n";
  Csv csv(data);
  CsvItem item;
  ASSERT_TRUE(csv.next(item));
  EXPECT_EQ(item.cell.data(), reinterpret_cast<const uint8_t*>(data.data()));
  ASSERT_TRUE(csv.next(item));
  EXPECT_EQ(item.cell.data(), reinterpret_cast<const uint8_t*>(data.data()) + 4);
  EXPECT_EQ(item.cell.start(), 4u);
  EXPECT_EQ(item.cell.end(), 6u);
}

TEST_F(CsvTest, PositionAndLineAdvance) {
  Csv csv("a,b\nc\n");
  CsvItem item;
  EXPECT_EQ(csv.position(), 0u);
  EXPECT_EQ(csv.line(), 1u);
  ASSERT_TRUE(csv.next(item));  // a
  EXPECT_EQ(csv.position(), 2u);
  ASSERT_TRUE(csv.next(item));  // b
  ASSERT_TRUE(csv.next(item));  // row end
  EXPECT_TRUE(item.is_row_end());
  EXPECT_EQ(csv.line(), 2u);
  EXPECT_EQ(csv.position(), 4u);
  ASSERT_TRUE(csv.next(item));  // c
  ASSERT_TRUE(csv.next(item));  // row end
  EXPECT_FALSE(csv.next(item));
  EXPECT_TRUE(csv.done());
  EXPECT_FALSE(csv.failed());
}

TEST_F(CsvTest, IndependentScannersShareBuffer) {
  std::string data = "a,b\n1,2\n";
  Csv first(data);
  Csv second(data);
  CsvItem a, b;
  ASSERT_TRUE(first.next(a));
  ASSERT_TRUE(first.next(a));
  ASSERT_TRUE(second.next(b));
  EXPECT_EQ(a.cell.raw(), "b");
  EXPECT_EQ(b.cell.raw(), "a");
}

TEST_F(CsvTest, CopyResumesFromSamePoint) {
  std::string data = "a,b,c";
  Csv csv(data);
  CsvItem item;
  ASSERT_TRUE(csv.next(item));
  Csv copy = csv;
  ASSERT_TRUE(csv.next(item));
  EXPECT_EQ(item.cell.raw(), "b");
  ASSERT_TRUE(copy.next(item));
  EXPECT_EQ(item.cell.raw(), "b");
}

// ============================================================================
// RANGE-FOR
// ============================================================================

TEST_F(CsvTest, RangeForVisitsEveryItem) {
  std::string data = "a,b\n1,2";
  Csv csv(data);
  size_t cells = 0, rows = 0;
  for (const auto& item : csv) {
    if (item.is_cell()) ++cells;
    else ++rows;
  }
  EXPECT_EQ(cells, 4u);
  EXPECT_EQ(rows, 2u);
}

TEST_F(CsvTest, RangeForThrowsOnSyntaxError) {
  std::string data = "a,\"b";
  Csv csv(data);
  try {
    for (const auto& item : csv) {
      (void)item;
    }
    FAIL() << "expected ParseException";
  } catch (const ParseException& e) {
    EXPECT_EQ(e.error().code, ErrorCode::UNCLOSED_QUOTE);
  }
}

// ============================================================================
// SKIP
// ============================================================================

TEST_F(CsvTest, SkipRowsSkipsRawLines) {
  std::string data = "h1,h2\nskip,me\n1,2\n";
  Csv csv(data);
  csv.skip_rows(2);
  EXPECT_EQ(csv.line(), 3u);
  Rows expected = {{"1", "2"}};
  EXPECT_EQ(collectRows(csv), expected);
}

TEST_F(CsvTest, SkipZeroIsNoOp) {
  std::string data = "a\nb\n";
  Csv csv(data);
  csv.skip_rows(0);
  EXPECT_EQ(csv.position(), 0u);
  EXPECT_EQ(collectRows(csv).size(), 2u);
}

TEST_F(CsvTest, SkipPastEndFinishes) {
  std::string data = "a\nb\n";
  Csv csv(data);
  csv.skip_rows(5);
  EXPECT_TRUE(csv.done());
  EXPECT_FALSE(csv.failed());
  CsvItem item;
  EXPECT_FALSE(csv.next(item));
}

TEST_F(CsvTest, SkipAllLinesExactly) {
  std::string data = "a\nb\n";
  Csv csv(data);
  csv.skip_rows(2);
  EXPECT_TRUE(csv.done());
}

TEST_F(CsvTest, SkipAfterPendingRowEnd) {
  std::string data = "a\nb\nc\n";
  Csv csv(data);
  CsvItem item;
  ASSERT_TRUE(csv.next(item));  // "a", ROW_END pending
  csv.skip_rows(1);             // skips "b"
  Rows expected = {{"c"}};
  EXPECT_EQ(collectRows(csv), expected);
}

TEST_F(CsvTest, SkipMidRowSkipsRestOfRow) {
  std::string data = "a,b\nc\n";
  Csv csv(data);
  CsvItem item;
  ASSERT_TRUE(csv.next(item));  // "a"
  csv.skip_rows(1);
  Rows expected = {{"c"}};
  EXPECT_EQ(collectRows(csv), expected);
}

TEST_F(CsvTest, SkipCountsNewlinesInsideQuotes) {
  // Cheap skipping does not track quotes: the embedded newline counts
  std::string data = "\"x\ny\"\nz\n";
  Csv csv(data);
  csv.skip_rows(1);
  EXPECT_EQ(csv.position(), 3u);
  // Scanning resumes inside the quoted cell, at `y"`
  CsvItem item;
  EXPECT_FALSE(csv.next(item));
  ASSERT_TRUE(csv.failed());
  EXPECT_EQ(csv.error()->code, ErrorCode::QUOTE_IN_UNQUOTED_FIELD);
  EXPECT_EQ(csv.error()->byte_offset, 4u);
}

// ============================================================================
// FIXTURES
// ============================================================================

TEST_F(CsvTest, SimpleFixture) {
  std::string data = lazycsv_test::readFile(getTestDataPath("basic/simple.csv"));
  Rows expected = {{"a", "b", "c"}, {"1", "2", "3"}, {"4", "5", "6"}};
  EXPECT_EQ(collectRows(data), expected);
}

TEST_F(CsvTest, NoTrailingNewlineFixture) {
  std::string data =
      lazycsv_test::readFile(getTestDataPath("basic/simple_no_trailing_newline.csv"));
  Rows rows = collectRows(data);
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows.back(), (std::vector<std::string>{"4", "5", "6"}));
}

TEST_F(CsvTest, EmptyFieldsFixture) {
  std::string data = lazycsv_test::readFile(getTestDataPath("basic/empty_fields.csv"));
  Rows expected = {{"a", "", "c"}, {"", "", ""}};
  EXPECT_EQ(collectRows(data), expected);
}

TEST_F(CsvTest, QuotedFieldsFixture) {
  if (!allocation_supported()) GTEST_SKIP() << "needs the allocating decoder";
  std::string data = lazycsv_test::readFile(getTestDataPath("quoted/quoted_fields.csv"));
  Rows expected = {{"id", "comment"},
                   {"1", "hello, world"},
                   {"2", "say \"hi\""},
                   {"3", "two\nlines"}};
  EXPECT_EQ(collectRows(data), expected);
}

TEST_F(CsvTest, SeparatorFixtures) {
  Rows tab = collectRows(lazycsv_test::readFile(getTestDataPath("separators/tab.tsv")),
                         Dialect::tsv());
  Rows semi = collectRows(lazycsv_test::readFile(getTestDataPath("separators/semicolon.csv")),
                          Dialect::semicolon());
  Rows pipe = collectRows(lazycsv_test::readFile(getTestDataPath("separators/pipe.csv")),
                          Dialect::pipe());
  Rows expected = {{"a", "b", "c"}, {"1", "2", "3"}};
  EXPECT_EQ(tab, expected);
  EXPECT_EQ(pipe, expected);
  ASSERT_EQ(semi.size(), 2u);
  EXPECT_EQ(semi[1][1], "2,5");
}

TEST_F(CsvTest, LargeInputSpanningManyBlocks) {
  std::string data;
  for (int i = 0; i < 1000; ++i) {
    data += std::to_string(i) + ",\"v" + std::to_string(i) + "\",x\n";
  }
  Rows rows = collectRows(data);
  ASSERT_EQ(rows.size(), 1000u);
  EXPECT_EQ(rows[999][0], "999");
  EXPECT_EQ(rows[500][1], "v500");
}

// ============================================================================
// CELL IDENTITY
// ============================================================================

TEST_F(CsvTest, CellEqualityUsesQuotedFlagAndRawBytes) {
  std::string data = "ab,\"ab\",ab";
  Csv csv(data);
  CsvItem item;
  std::vector<Cell> cells;
  while (csv.next(item)) {
    if (item.is_cell()) cells.push_back(item.cell);
  }
  ASSERT_EQ(cells.size(), 3u);
  EXPECT_EQ(cells[0], cells[2]);
  EXPECT_NE(cells[0], cells[1]);
  EXPECT_TRUE(cells[0] < cells[1]);

  std::unordered_set<Cell> unique(cells.begin(), cells.end());
  EXPECT_EQ(unique.size(), 2u);
}
