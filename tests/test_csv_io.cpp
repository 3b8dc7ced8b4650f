#include <gtest/gtest.h>
#include <compare/comparison.hpp>
#include <io/csv_reader.hpp>
#include <io/csv_report_writer.hpp>
#include <io/text_file.hpp>
#include "test_helpers.hpp"
#include <filesystem>
#include <stdexcept>

using namespace funnel;
using namespace funnel::io;
using namespace funnel::test;

// ============================================
// Reading
// ============================================

TEST(CsvReaderTest, CommaAndSemicolon) {
    DataSet data = parse_csv("time,value\n0,1.5\n1;2.5\n2,;3.5\n");

    expect_points_near(data, {{0.0, 1.5}, {1.0, 2.5}, {2.0, 3.5}});
}

TEST(CsvReaderTest, ScientificNotationAndWhitespace) {
    DataSet data = parse_csv("x,y\n1e-3, -2.5E2\n  2.0,4  \r\n");

    expect_points_near(data, {{1e-3, -250.0}, {2.0, 4.0}});
}

TEST(CsvReaderTest, SkipsConfiguredHeaderLines) {
    CsvOptions options;
    options.skip_lines = 3;

    DataSet data = parse_csv("model\nunits s,K\ntime,T\n0,300\n1,301\n", options);

    expect_points_near(data, {{0.0, 300.0}, {1.0, 301.0}});
}

TEST(CsvReaderTest, NoHeader) {
    CsvOptions options;
    options.skip_lines = 0;

    EXPECT_EQ(parse_csv("0,1\n2,3", options).size(), 2u);
}

TEST(CsvReaderTest, BlankLinesIgnored) {
    DataSet data = parse_csv("x,y\n\n0,1\n   \n1,2\n\n");

    EXPECT_EQ(data.size(), 2u);
}

TEST(CsvReaderTest, StopsAtFirstBadLine) {
    DataSet data = parse_csv("x,y\n0,1\n1,2\nend of data\n3,4\n");

    expect_points_near(data, {{0.0, 1.0}, {1.0, 2.0}});
}

TEST(CsvReaderTest, SingleColumnIsBadLine) {
    EXPECT_TRUE(parse_csv("x,y\n0\n1,2\n").empty());
    EXPECT_TRUE(parse_csv("x,y\n0 1\n").empty());
    EXPECT_TRUE(parse_csv("x,y\n0,1,2\n").empty());
}

TEST(CsvReaderTest, MissingFileThrows) {
    EXPECT_THROW(read_csv("/nonexistent/funnel/reference.csv"), std::runtime_error);
}

TEST(CsvReaderTest, ReadsFile) {
    TempDir dir("funnel_csv");
    std::filesystem::create_directories(dir.path());
    std::string path = (dir.path() / "trended.csv").string();
    write_file(path, "time;value\n0;0\n0.5;0.25\n");

    DataSet data = read_csv(path);

    expect_points_near(data, {{0.0, 0.0}, {0.5, 0.25}});
}

// ============================================
// Writing
// ============================================

TEST(CsvReportWriterTest, SixDecimals) {
    DataSet data = make_curve({{1.0, 2.0}, {0.5, -0.25}, {1.0 / 3.0, 1e-8}});

    EXPECT_EQ(to_csv(data),
              "x,y\n1.000000,2.000000\n0.500000,-0.250000\n0.333333,0.000000\n");
}

TEST(CsvReportWriterTest, EmptyCurveHasHeaderOnly) {
    EXPECT_EQ(to_csv(DataSet{}), "x,y\n");
}

TEST(CsvReportWriterTest, WritesFiveFilesThatReadBack) {
    TempDir dir("funnel_writer");
    DataSet ref = make_curve({{0.0, 0.0}, {1.0, 1.0}, {2.0, 0.0}});
    ComparisonResult result = compare_curves(ref, ref, Tolerances::absolute(0.1, 0.1));

    CsvReportWriter writer(dir.path().string());
    writer.write(result);

    EXPECT_EQ(read_csv((dir.path() / REFERENCE_FILE).string()).size(), 3u);
    EXPECT_EQ(read_csv((dir.path() / LOWER_BOUND_FILE).string()).size(), result.lower.size());
    EXPECT_EQ(read_csv((dir.path() / UPPER_BOUND_FILE).string()).size(), result.upper.size());
    EXPECT_EQ(read_csv((dir.path() / TEST_FILE).string()).size(), 3u);
    EXPECT_EQ(read_csv((dir.path() / ERRORS_FILE).string()).size(), 3u);
}

TEST(CsvReportWriterTest, EmptyDirectoryThrows) {
    DataSet ref = make_curve({{0.0, 0.0}, {1.0, 1.0}});
    ComparisonResult result = compare_curves(ref, ref, Tolerances::absolute(0.1, 0.1));

    CsvReportWriter writer("");
    EXPECT_THROW(writer.write(result), std::runtime_error);
}
