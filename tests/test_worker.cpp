#include <gtest/gtest.h>

#include <filesystem>

#include "dotsweep/worker.h"
#include "dotsweep/xattr.h"
#include "test_support.h"

using namespace dotsweep;
using dotsweep::testing::FakeXattrBackend;
namespace fs = std::filesystem;

class WorkerTest : public dotsweep::testing::TempTreeTest {
protected:
    Outcome process(const fs::path& path) { return process_file(FileTask{path, &options_}, backend_); }

    Config::Options options_{};
    FakeXattrBackend backend_;
};

TEST_F(WorkerTest, JunkFileIsDeleted) {
    const auto junk = touch("a/.DS_Store");
    const auto outcome = process(junk);
    EXPECT_TRUE(outcome.junk);
    EXPECT_FALSE(outcome.file);
    EXPECT_TRUE(outcome.attrs.empty());
    EXPECT_FALSE(fs::exists(junk));
}

TEST_F(WorkerTest, DryRunReportsWithoutDeleting) {
    options_.dry_run = true;
    const auto junk = touch("a/.DS_Store");
    const auto outcome = process(junk);
    EXPECT_TRUE(outcome.junk);
    EXPECT_TRUE(fs::exists(junk));
}

TEST_F(WorkerTest, ProvenanceMarkerIsDeleted) {
    const auto marker = touch("b/report.pdf:Zone.Identifier");
    const auto outcome = process(marker);
    EXPECT_TRUE(outcome.file);
    EXPECT_FALSE(outcome.junk);
    EXPECT_FALSE(fs::exists(marker));
}

TEST_F(WorkerTest, OrdinaryFileProducesEmptyOutcome) {
    const auto plain = touch("note.txt");
    const auto outcome = process(plain);
    EXPECT_FALSE(outcome.junk);
    EXPECT_FALSE(outcome.file);
    EXPECT_TRUE(outcome.attrs.empty());
    EXPECT_FALSE(outcome.any());
    EXPECT_TRUE(fs::exists(plain));
}

TEST_F(WorkerTest, MissingFileIsNeverCounted) {
    options_.dry_run = true;
    const auto outcome = process(root_ / "gone" / ".DS_Store");
    EXPECT_FALSE(outcome.any());
    EXPECT_EQ(backend_.probes.load(), 0);
}

TEST_F(WorkerTest, DirectoryIsNeverRemoved) {
    fs::create_directories(root_ / "cache.tmp");
    EXPECT_FALSE(remove_file(root_ / "cache.tmp", false));
    EXPECT_TRUE(fs::is_directory(root_ / "cache.tmp"));
}

TEST_F(WorkerTest, AttributeSweepFollowsCandidateOrder) {
    options_.extra_attributes = {"com.apple.quarantine", "user.origin"};
    const auto file = touch("download.zip");
    backend_.set(file, "user.origin");
    backend_.set(file, "user.Zone.Identifier");

    const auto outcome = process(file);
    ASSERT_EQ(outcome.attrs.size(), 2u);
    EXPECT_EQ(outcome.attrs[0], "user.Zone.Identifier");
    EXPECT_EQ(outcome.attrs[1], "user.origin");
    EXPECT_FALSE(backend_.has(file, "user.Zone.Identifier"));
    EXPECT_FALSE(backend_.has(file, "user.origin"));
}

TEST_F(WorkerTest, AttributesAreRemovedIndependently) {
    options_.extra_attributes = {"user.keep"};
    const auto file = touch("download.zip");
    backend_.set(file, "user.Zone.Identifier");
    backend_.set(file, "user.other");

    const auto outcome = process(file);
    ASSERT_EQ(outcome.attrs.size(), 1u);
    EXPECT_EQ(outcome.attrs[0], "user.Zone.Identifier");
    EXPECT_TRUE(backend_.has(file, "user.other"));
}

TEST_F(WorkerTest, DuplicateCandidatesAreHarmless) {
    options_.extra_attributes = {"user.Zone.Identifier"};
    const auto file = touch("download.zip");
    backend_.set(file, "user.Zone.Identifier");

    const auto outcome = process(file);
    ASSERT_EQ(outcome.attrs.size(), 1u);
    EXPECT_FALSE(backend_.has(file, "user.Zone.Identifier"));
}

TEST_F(WorkerTest, DeletedJunkSkipsAttributeSweep) {
    const auto junk = touch("Thumbs.db");
    backend_.set(junk, "user.Zone.Identifier");
    const auto outcome = process(junk);
    EXPECT_TRUE(outcome.junk);
    EXPECT_TRUE(outcome.attrs.empty());
}

TEST_F(WorkerTest, DryRunAttributesAreOptimistic) {
    options_.dry_run = true;
    options_.extra_attributes = {"user.extra"};
    const auto file = touch("photo.jpg");

    const auto outcome = process(file);
    ASSERT_EQ(outcome.attrs.size(), 2u);
    EXPECT_EQ(backend_.probes.load(), 0);
    EXPECT_EQ(backend_.removals.load(), 0);
}

TEST_F(WorkerTest, SecondRunFindsNothing) {
    touch(".DS_Store");
    const auto marker = touch("x.pdf:Zone.Identifier");
    backend_.set(marker, "user.Zone.Identifier");

    EXPECT_TRUE(process(root_ / ".DS_Store").any());
    EXPECT_TRUE(process(marker).any());
    EXPECT_FALSE(process(root_ / ".DS_Store").any());
    EXPECT_FALSE(process(marker).any());
}

TEST(AttributeCandidatesTest, BuiltInComesFirst) {
    Config::Options options;
    options.extra_attributes = {"user.a", "user.b"};
    const auto names = attribute_candidates(options);
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "user.Zone.Identifier");
    EXPECT_EQ(names[1], "user.a");
    EXPECT_EQ(names[2], "user.b");
}
