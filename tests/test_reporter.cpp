#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "dotsweep/csv_writer.h"
#include "dotsweep/progress.h"
#include "dotsweep/reporter.h"
#include "test_support.h"

using namespace dotsweep;
namespace fs = std::filesystem;

namespace {
Outcome make_outcome(bool file, std::vector<std::string> attrs, bool junk) {
    Outcome outcome;
    outcome.file = file;
    outcome.attrs = std::move(attrs);
    outcome.junk = junk;
    return outcome;
}
} // namespace

TEST(ReportTest, SumsEachField) {
    Report report;
    report.add("a/.DS_Store", make_outcome(false, {}, true));
    report.add("b/x.pdf:Zone.Identifier", make_outcome(true, {}, false));
    report.add("c/setup.exe", make_outcome(false, {"user.Zone.Identifier", "user.extra"}, false));
    report.add("d/plain.txt", make_outcome(false, {}, false));

    EXPECT_EQ(report.processed(), 4u);
    EXPECT_EQ(report.junk_removed(), 1u);
    EXPECT_EQ(report.files_removed(), 1u);
    EXPECT_EQ(report.attributes_removed(), 2u);
    ASSERT_EQ(report.affected().size(), 3u);
    EXPECT_EQ(report.affected()[0], fs::path{"a/.DS_Store"});
    EXPECT_EQ(report.affected()[2], fs::path{"c/setup.exe"});
}

TEST(ReportTest, PrintsTotals) {
    RunResult result;
    result.total = 2;
    result.report.add("a/.DS_Store", make_outcome(false, {}, true));
    result.report.add("c/setup.exe", make_outcome(false, {"user.Zone.Identifier"}, false));

    Config::Options options;
    std::ostringstream out;
    print_report(out, result, options, false);
    const std::string text = out.str();
    EXPECT_NE(text.find("Zone.Identifier files removed: 0"), std::string::npos);
    EXPECT_NE(text.find("Extended attributes removed: 1"), std::string::npos);
    EXPECT_NE(text.find("Junk files removed: 1"), std::string::npos);
    EXPECT_EQ(text.find("a/.DS_Store"), std::string::npos);
    EXPECT_EQ(text.find('\x1b'), std::string::npos);
}

TEST(ReportTest, SummaryListsAffectedPaths) {
    RunResult result;
    result.total = 2;
    result.report.add("a/.DS_Store", make_outcome(false, {}, true));
    result.report.add("d/plain.txt", make_outcome(false, {}, false));

    Config::Options options;
    options.summary = true;
    options.dry_run = true;
    std::ostringstream out;
    print_report(out, result, options, false);
    const std::string text = out.str();
    EXPECT_NE(text.find("a/.DS_Store"), std::string::npos);
    EXPECT_EQ(text.find("d/plain.txt"), std::string::npos);
    EXPECT_NE(text.find("[dry-run] Junk files removed: 1"), std::string::npos);
}

TEST(ReportTest, InterruptionIsAnnounced) {
    RunResult result;
    result.total = 10;
    result.interrupted = true;
    result.report.add("a/.DS_Store", make_outcome(false, {}, true));

    Config::Options options;
    std::ostringstream out;
    print_report(out, result, options, true);
    const std::string text = out.str();
    EXPECT_NE(text.find("Interrupted"), std::string::npos);
    EXPECT_NE(text.find("1 of 10"), std::string::npos);
}

TEST(ReportTest, QuietPrintsNothing) {
    RunResult result;
    result.report.add("a/.DS_Store", make_outcome(false, {}, true));
    Config::Options options;
    options.quiet = true;
    std::ostringstream out;
    print_report(out, result, options, false);
    EXPECT_TRUE(out.str().empty());
}

TEST(CsvWriterTest, EscapesFields) {
    EXPECT_EQ(CsvWriter::escape("plain"), "plain");
    EXPECT_EQ(CsvWriter::escape("a,b"), "\"a,b\"");
    EXPECT_EQ(CsvWriter::escape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

class CsvWriterFileTest : public dotsweep::testing::TempTreeTest {};

TEST_F(CsvWriterFileTest, WritesAffectedOutcomesOnly) {
    const auto csv_path = root_ / "out.csv";
    {
        CsvWriter writer{csv_path, false};
        writer.on_start(3);
        writer.on_outcome("a/.DS_Store", make_outcome(false, {}, true));
        writer.on_outcome("d/plain.txt", make_outcome(false, {}, false));
        writer.on_outcome("c/set,up.exe", make_outcome(false, {"user.Zone.Identifier", "user.x"}, false));
        writer.on_finish(RunResult{});
    }

    std::ifstream in{csv_path};
    std::string header;
    std::string first;
    std::string second;
    std::string extra;
    std::getline(in, header);
    std::getline(in, first);
    std::getline(in, second);
    EXPECT_EQ(header, "path,file,attrs,junk,dry_run");
    EXPECT_EQ(first, "a/.DS_Store,0,,1,0");
    EXPECT_EQ(second, "\"c/set,up.exe\",0,user.Zone.Identifier;user.x,0,0");
    EXPECT_FALSE(std::getline(in, extra));
}

TEST_F(CsvWriterFileTest, UnwritablePathThrows) {
    EXPECT_THROW(CsvWriter(root_ / "no" / "such" / "dir" / "out.csv", false), std::runtime_error);
}

TEST(ProgressBarTest, DrawsCompletion) {
    std::ostringstream out;
    ProgressBar bar{out, 40};
    bar.on_start(4);
    for (int i = 0; i < 4; ++i) {
        bar.on_outcome("f", Outcome{});
    }
    bar.on_finish(RunResult{});

    const std::string text = out.str();
    EXPECT_NE(text.find("0/4"), std::string::npos);
    EXPECT_NE(text.find("100%"), std::string::npos);
    EXPECT_NE(text.find("4/4"), std::string::npos);
    EXPECT_EQ(text.back(), '\n');
}
