//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/corpus/corpus_walker.hpp"
#include "aua/utils/file_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace aua;
using namespace aua::corpus;
namespace fs = std::filesystem;

TEST(GlobTest, Translation) {
    EXPECT_EQ(glob_to_regex("*.py"), "^[^/]*\\.py$");
    EXPECT_EQ(glob_to_regex("a?b"), "^a[^/]b$");
    EXPECT_EQ(glob_to_regex("**/tests/**"), "^(?:.*/)?tests/.*$");
}

TEST(ExclusionSetTest, SingleStarStaysInComponent) {
    ExclusionSet set;
    set.add("*.py");

    EXPECT_TRUE(set.matches("setup.py"));
    EXPECT_FALSE(set.matches("pkg/setup.py"));
}

TEST(ExclusionSetTest, DoubleStarSpansDirectories) {
    ExclusionSet set;
    set.add("**/tests/**");

    EXPECT_TRUE(set.matches("tests/test_a.py"));
    EXPECT_TRUE(set.matches("pkg/sub/tests/test_a.py"));
    EXPECT_FALSE(set.matches("pkg/mytests/a.py"));
}

TEST(ExclusionSetTest, DirectoryEntriesExcludeSubtrees) {
    ExclusionSet set;
    set.add("vendor/");
    set.add("./build/*");

    EXPECT_TRUE(set.matches("vendor/lib/a.py"));
    EXPECT_TRUE(set.matches("build/gen/x.py"));
    EXPECT_TRUE(set.excludes_directory("vendor"));
    EXPECT_FALSE(set.matches("src/vendor.py"));
    EXPECT_FALSE(set.excludes_directory("build"));
    EXPECT_EQ(set.size(), 2u);
}

TEST(ExclusionSetTest, AbsolutePathEntries) {
    ExclusionSet set;
    set.add("/data/corpus/skip.py");

    EXPECT_TRUE(set.matches("skip.py", "/data/corpus/skip.py"));
    EXPECT_FALSE(set.matches("keep.py", "/data/corpus/keep.py"));
}

TEST(ExclusionSetTest, EmptySetMatchesNothing) {
    ExclusionSet set;
    set.add("   ");

    EXPECT_TRUE(set.empty());
    EXPECT_FALSE(set.matches("a.py"));
}

class CorpusWalkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / "aua_corpus_walker_test";
        fs::remove_all(temp_dir_);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        fs::remove_all(temp_dir_);
    }

    void create(const std::string& relative) const {
        const auto path = temp_dir_ / relative;
        fs::create_directories(path.parent_path());
        ASSERT_TRUE(file_utils::write_file(path, "x = 1\n").is_ok());
    }

    static std::vector<std::string> names(const std::vector<SourceFile>& files) {
        std::vector<std::string> result;
        for (const auto& file : files) {
            result.push_back(file.relative_path);
        }
        return result;
    }

    fs::path temp_dir_;
};

TEST_F(CorpusWalkerTest, ListsPythonFilesSorted) {
    create("b.py");
    create("a.py");
    create("notes.txt");
    create("pkg/UPPER.PY");
    create("pkg/sub/c.py");

    WalkOptions options;
    options.root = temp_dir_;
    const auto files = walk_corpus(options);

    ASSERT_TRUE(files.is_ok());
    EXPECT_EQ(names(files.value()), (std::vector<std::string>{"a.py", "b.py", "pkg/UPPER.PY", "pkg/sub/c.py"}));
    EXPECT_TRUE(files.value().front().text.empty());
    EXPECT_TRUE(fs::exists(files.value().front().absolute_path));
}

TEST_F(CorpusWalkerTest, AppliesExclusions) {
    create("a.py");
    create("vendor/v.py");
    create("build/gen/x.py");
    create("pkg/tests/test_a.py");
    create("pkg/core.py");

    WalkOptions options;
    options.root = temp_dir_;
    options.exclusions.add("vendor");
    options.exclusions.add("build/*");
    options.exclusions.add("**/tests/**");

    const auto files = walk_corpus(options);
    ASSERT_TRUE(files.is_ok());
    EXPECT_EQ(names(files.value()), (std::vector<std::string>{"a.py", "pkg/core.py"}));
}

TEST_F(CorpusWalkerTest, CustomExtensions) {
    create("a.py");
    create("b.pyi");

    WalkOptions options;
    options.root = temp_dir_;
    options.extensions = {"pyi"};

    const auto files = walk_corpus(options);
    ASSERT_TRUE(files.is_ok());
    EXPECT_EQ(names(files.value()), std::vector<std::string>{"b.pyi"});
}

TEST_F(CorpusWalkerTest, MissingRootIsConfigError) {
    WalkOptions options;
    options.root = temp_dir_ / "missing";

    const auto files = walk_corpus(options);
    ASSERT_TRUE(files.is_err());
    EXPECT_EQ(files.error().code(), ErrorCode::ConfigError);

    create("file.py");
    options.root = temp_dir_ / "file.py";
    EXPECT_TRUE(walk_corpus(options).is_err());
}

TEST_F(CorpusWalkerTest, ExclusionFile) {
    const auto path = temp_dir_ / "corpus.exclude";
    ASSERT_TRUE(file_utils::write_file(path, "# generated code\n\n  build/  \nvendor\n").is_ok());

    const auto set = ExclusionSet::from_file(path);
    ASSERT_TRUE(set.is_ok());
    EXPECT_EQ(set.value().size(), 2u);
    EXPECT_TRUE(set.value().matches("build/x.py"));

    const auto missing = ExclusionSet::from_file(temp_dir_ / "nope");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigError);
}
