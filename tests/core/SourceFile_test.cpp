#include <gtest/gtest.h>
#include "core/SourceFile.hpp"
#include "core/Errors.hpp"
#include <filesystem>

using namespace funcscan;
namespace fs = std::filesystem;

TEST(SourceFileTest, LinesKeepTerminators) {
    SourceFile source("a\nbb\n\nccc");

    ASSERT_EQ(source.line_count(), 4u);
    EXPECT_EQ(source.lines()[0], "a\n");
    EXPECT_EQ(source.lines()[1], "bb\n");
    EXPECT_EQ(source.lines()[2], "\n");
    EXPECT_EQ(source.lines()[3], "ccc");
}

TEST(SourceFileTest, SliceReproducesExactText) {
    std::string text = "one\ntwo\nthree\nfour\n";
    SourceFile source(text);

    EXPECT_EQ(slice_lines(source.lines(), 2, 3), "two\nthree\n");
    EXPECT_EQ(slice_lines(source.lines(), 1, 4), text);
    EXPECT_EQ(slice_lines(source.lines(), 4, 4), "four\n");
}

TEST(SourceFileTest, SliceClampsToFile) {
    SourceFile source("one\ntwo\n");

    EXPECT_EQ(slice_lines(source.lines(), 2, 10), "two\n");
    EXPECT_EQ(slice_lines(source.lines(), 3, 5), "");
}

TEST(SourceFileTest, NormalizesCarriageReturns) {
    SourceFile source("a\r\nb\rc\n");

    EXPECT_EQ(source.text(), "a\nb\nc\n");
    ASSERT_EQ(source.line_count(), 3u);
    EXPECT_EQ(source.lines()[1], "b\n");
}

TEST(SourceFileTest, EmptyText) {
    SourceFile source("");

    EXPECT_TRUE(source.text().empty());
    EXPECT_EQ(source.line_count(), 0u);
}

TEST(SourceFileTest, LoadFixture) {
    fs::path fixture = fs::path(__FILE__).parent_path() / ".." / "fixtures" / "simple_module.py";
    ASSERT_TRUE(fs::exists(fixture)) << "Fixture not found: " << fixture;

    SourceFile source = SourceFile::load(fixture);

    EXPECT_EQ(source.path(), fixture);
    EXPECT_EQ(source.lines()[0], "import os\n");
    EXPECT_EQ(source.line_count(), 35u);
}

TEST(SourceFileTest, LoadMissingFileThrows) {
    EXPECT_THROW(SourceFile::load("/nonexistent/file.py"), IOError);
}

TEST(SourceFileTest, LoadDirectoryThrows) {
    fs::path dir = fs::path(__FILE__).parent_path();
    EXPECT_THROW(SourceFile::load(dir), IOError);
}
