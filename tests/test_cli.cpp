#include <gtest/gtest.h>
#include <cli/cli_common.hpp>
#include <io/csv_reader.hpp>
#include <io/csv_report_writer.hpp>
#include <io/text_file.hpp>
#include <serialization/comparison_json.hpp>
#include <serialization/json_serialization.hpp>
#include "test_helpers.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace funnel;
using namespace funnel::cli;
using namespace funnel::test;

namespace {

// Owns the strings behind a mutable argv
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "funnel");
        for (auto& s : storage_) {
            argv_.push_back(s.data());
        }
    }

    int argc() const { return static_cast<int>(argv_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

CommandContext parse(std::initializer_list<std::string> args) {
    Args a(args);
    return parse_args(a.argc(), a.argv());
}

int run(std::initializer_list<std::string> args) {
    Args a(args);
    return command_compare(a.argc(), a.argv());
}

}  // namespace

// ============================================
// Argument parsing
// ============================================

TEST(CliArgsTest, LongOptions) {
    CommandContext ctx = parse({"--test", "sim.csv", "--reference", "ref.csv",
                                "--output", "out", "--atolx", "0.002", "--atoly", "1e-3",
                                "--rtolx", "0", "--rtoly", "0.05"});

    EXPECT_EQ(ctx.test_path, "sim.csv");
    EXPECT_EQ(ctx.reference_path, "ref.csv");
    EXPECT_EQ(ctx.output_path, "out");
    EXPECT_DOUBLE_EQ(ctx.atolx.value(), 0.002);
    EXPECT_DOUBLE_EQ(ctx.atoly.value(), 1e-3);
    EXPECT_DOUBLE_EQ(ctx.rtolx.value(), 0.0);
    EXPECT_DOUBLE_EQ(ctx.rtoly.value(), 0.05);
    EXPECT_FALSE(ctx.config_path.has_value());
    EXPECT_FALSE(ctx.write_summary);
}

TEST(CliArgsTest, ShortAndSingleDashForms) {
    CommandContext ctx = parse({"-t", "sim.csv", "-r", "ref.csv", "-o", "out",
                                "-atolx", "0.1", "-rtoly", "0.2", "-c", "cfg.json",
                                "-skip-lines", "0", "-v", "--summary"});

    EXPECT_EQ(ctx.test_path, "sim.csv");
    EXPECT_EQ(ctx.reference_path, "ref.csv");
    EXPECT_EQ(ctx.output_path, "out");
    EXPECT_DOUBLE_EQ(ctx.atolx.value(), 0.1);
    EXPECT_DOUBLE_EQ(ctx.rtoly.value(), 0.2);
    EXPECT_FALSE(ctx.atoly.has_value());
    EXPECT_EQ(ctx.config_path.value(), "cfg.json");
    EXPECT_EQ(ctx.skip_lines.value(), 0u);
    EXPECT_TRUE(ctx.verbose);
    EXPECT_TRUE(ctx.write_summary);
}

TEST(CliArgsTest, Help) {
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_TRUE(parse({"--help"}).help);
}

TEST(CliArgsTest, UnknownOptionThrows) {
    EXPECT_THROW(parse({"--tolerance", "0.1"}), std::runtime_error);
}

TEST(CliArgsTest, MissingValueThrows) {
    EXPECT_THROW(parse({"--test"}), std::runtime_error);
}

TEST(CliArgsTest, BadNumberIsConfigurationError) {
    EXPECT_THROW(parse({"--atolx", "tiny"}), ConfigurationError);
    EXPECT_THROW(parse({"--atolx", "0.1s"}), ConfigurationError);
    EXPECT_THROW(parse({"--skip-lines", "-1"}), ConfigurationError);
}

TEST(CliArgsTest, LogLevel) {
    EXPECT_EQ(parse({"--log-level", "warn"}).log_level.value(), "warn");
    EXPECT_EQ(parse({"-log-level", "off"}).log_level.value(), "off");
    EXPECT_FALSE(parse({"-v"}).log_level.has_value());
}

TEST(CliArgsTest, OverridesReplaceConfigValues) {
    RunConfig config;
    config.tolerances = Tolerances{.atolx = 1.0, .atoly = 2.0, .rtolx = 3.0, .rtoly = 4.0};
    config.csv.skip_lines = 5;

    CommandContext ctx = parse({"--atoly", "0.5", "--skip-lines", "2"});
    RunConfig merged = apply_overrides(config, ctx);

    EXPECT_DOUBLE_EQ(merged.tolerances.atolx, 1.0);
    EXPECT_DOUBLE_EQ(merged.tolerances.atoly, 0.5);
    EXPECT_DOUBLE_EQ(merged.tolerances.rtolx, 3.0);
    EXPECT_DOUBLE_EQ(merged.tolerances.rtoly, 4.0);
    EXPECT_EQ(merged.csv.skip_lines, 2u);
}

// ============================================
// Compare command
// ============================================

class CompareCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>("funnel_cli");
        std::filesystem::create_directories(dir_->path());
        reference_ = (dir_->path() / "reference_in.csv").string();
        io::write_file(reference_, "time,value\n0,0\n1,1\n2,0\n");
        output_ = (dir_->path() / "out").string();
    }

    std::string write_test(const std::string& content) {
        std::string path = (dir_->path() / "test_in.csv").string();
        io::write_file(path, content);
        return path;
    }

    std::unique_ptr<TempDir> dir_;
    std::string reference_;
    std::string output_;
};

TEST_F(CompareCommandTest, PassingRunWritesReport) {
    std::string test = write_test("time,value\n0,0\n1,0.95\n2,0\n");

    int rc = run({"-t", test, "-r", reference_, "-o", output_,
                  "--atolx", "0.1", "--atoly", "0.1"});

    EXPECT_EQ(rc, 0);
    std::filesystem::path out(output_);
    EXPECT_TRUE(std::filesystem::exists(out / io::REFERENCE_FILE));
    EXPECT_TRUE(std::filesystem::exists(out / io::LOWER_BOUND_FILE));
    EXPECT_TRUE(std::filesystem::exists(out / io::UPPER_BOUND_FILE));
    EXPECT_TRUE(std::filesystem::exists(out / io::TEST_FILE));
    EXPECT_TRUE(std::filesystem::exists(out / io::ERRORS_FILE));
    EXPECT_FALSE(std::filesystem::exists(out / SUMMARY_FILE));
}

TEST_F(CompareCommandTest, OutliersStillExitZero) {
    std::string test = write_test("time,value\n0,0\n1,0.5\n2,0\n");

    int rc = run({"-t", test, "-r", reference_, "-o", output_,
                  "-atolx", "0.1", "-atoly", "0.1"});

    EXPECT_EQ(rc, 0);
    DataSet errors = io::read_csv((std::filesystem::path(output_) / io::ERRORS_FILE).string());
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_NEAR(errors[1].y, 0.3, 1e-6);
}

TEST_F(CompareCommandTest, SummaryJson) {
    std::string test = write_test("time,value\n0,0\n1,0.5\n2,0\n");

    int rc = run({"-t", test, "-r", reference_, "-o", output_,
                  "--atolx", "0.1", "--atoly", "0.1", "--summary"});

    ASSERT_EQ(rc, 0);
    auto summary = funnel::json::read_serialized(
        (std::filesystem::path(output_) / SUMMARY_FILE).string());
    EXPECT_EQ(summary.kind, "comparison");
    EXPECT_EQ(summary.reference_file, reference_);
    EXPECT_EQ(summary.test_file, test);
    EXPECT_EQ(summary.stats["outlier_count"], 1);
}

TEST_F(CompareCommandTest, ConfigFileSuppliesTolerances) {
    std::string test = write_test("time,value\n0,0\n1,0.95\n2,0\n");
    std::string config = (dir_->path() / "funnel.json").string();
    io::write_file(config, R"({"tolerances": {"atolx": 0.1, "atoly": 0.1}})");

    EXPECT_EQ(run({"-t", test, "-r", reference_, "-o", output_, "-c", config}), 0);
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(output_) / io::ERRORS_FILE));
}

TEST_F(CompareCommandTest, MissingToleranceFailsBeforeWriting) {
    std::string test = write_test("time,value\n0,0\n1,1\n2,0\n");

    int rc = run({"-t", test, "-r", reference_, "-o", output_, "--atoly", "0.1"});

    EXPECT_EQ(rc, 1);
    EXPECT_FALSE(std::filesystem::exists(output_));
}

TEST_F(CompareCommandTest, MissingInputFileFails) {
    int rc = run({"-t", (dir_->path() / "absent.csv").string(), "-r", reference_,
                  "-o", output_, "--atolx", "0.1", "--atoly", "0.1"});

    EXPECT_EQ(rc, 1);
}

TEST_F(CompareCommandTest, MissingPathsPrintUsage) {
    EXPECT_EQ(run({"--atolx", "0.1", "--atoly", "0.1"}), 1);
    EXPECT_EQ(run({"--help"}), 0);
}

TEST_F(CompareCommandTest, UnknownOptionFails) {
    EXPECT_EQ(run({"--bogus"}), 1);
}

TEST_F(CompareCommandTest, UnknownLogLevelFails) {
    std::string test = write_test("time,value\n0,0\n1,1\n2,0\n");

    int rc = run({"-t", test, "-r", reference_, "-o", output_,
                  "--atolx", "0.1", "--atoly", "0.1", "--log-level", "loud"});

    EXPECT_EQ(rc, 1);
    EXPECT_FALSE(std::filesystem::exists(output_));
}

TEST_F(CompareCommandTest, NaNSampleFailsBeforeWriting) {
    std::string test = write_test("time,value\n0,0\n1,nan\n2,0\n");

    int rc = run({"-t", test, "-r", reference_, "-o", output_,
                  "--atolx", "0.1", "--atoly", "0.1"});

    EXPECT_EQ(rc, 1);
    EXPECT_FALSE(std::filesystem::exists(output_));
}
