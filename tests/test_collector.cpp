#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <string>

#include "dotsweep/collector.h"
#include "test_support.h"

using namespace dotsweep;
namespace fs = std::filesystem;

class CollectorTest : public dotsweep::testing::TempTreeTest {
protected:
    void SetUp() override {
        TempTreeTest::SetUp();
        touch("top.txt");
        touch(".DS_Store");
        touch("sub/inner.bak");
        touch("sub/deeper/file.swp");
        touch(".git/objects/ab.tmp");
        touch("project/.svn/entries.tmp");
        options_.root = root_;
    }

    std::set<std::string> collect_relative() const {
        std::set<std::string> names;
        for (const auto& path : FileCollector{options_}.collect()) {
            names.insert(fs::relative(path, root_).generic_string());
        }
        return names;
    }

    Config::Options options_{};
};

TEST_F(CollectorTest, RecursiveListsEveryFile) {
    const auto names = collect_relative();
    const std::set<std::string> expected{"top.txt", ".DS_Store", "sub/inner.bak", "sub/deeper/file.swp",
                                         ".git/objects/ab.tmp", "project/.svn/entries.tmp"};
    EXPECT_EQ(names, expected);
}

TEST_F(CollectorTest, ExcludeVcsSkipsRepositoryDirectories) {
    options_.exclude_vcs = true;
    const auto names = collect_relative();
    const std::set<std::string> expected{"top.txt", ".DS_Store", "sub/inner.bak", "sub/deeper/file.swp"};
    EXPECT_EQ(names, expected);
}

TEST_F(CollectorTest, FlatListsTopLevelFilesOnly) {
    options_.recursive = false;
    const auto names = collect_relative();
    const std::set<std::string> expected{"top.txt", ".DS_Store"};
    EXPECT_EQ(names, expected);
}

TEST_F(CollectorTest, MissingRootYieldsNothing) {
    options_.root = root_ / "does-not-exist";
    EXPECT_TRUE(FileCollector{options_}.collect().empty());
}

TEST_F(CollectorTest, DirectorySymlinksAreNotFollowed) {
    std::error_code ec;
    fs::create_directory_symlink(root_ / "sub", root_ / "link", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }
    const auto names = collect_relative();
    EXPECT_EQ(names.count("link/inner.bak"), 0u);
    EXPECT_EQ(names.count("sub/inner.bak"), 1u);
}
