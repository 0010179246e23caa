#include <gtest/gtest.h>

#include <string>

#include "Fakes.hpp"
#include "HashSplit.hpp"

TEST(HashSplit, Filenames) {
    EXPECT_EQ(SplitFilename(0), "raw-hash-01");
    EXPECT_EQ(SplitFilename(9), "raw-hash-10");
    EXPECT_EQ(SplitFilename(99), "raw-hash-100");
}

TEST(HashSplit, SplitsIntoParts) {
    TempDirectory dir("split");
    std::string contents;
    for (size_t i = 0; i < 7; i++)
    {
        contents += "line" + std::to_string(i) + "\n";
    }
    auto input = dir.Write("dump.txt", contents);
    auto outdir = dir.GetPath() / "parts";

    auto parts = SplitFile(input, outdir, 3);
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts->size(), 3);
    EXPECT_EQ((*parts)[0], outdir / "raw-hash-01");
    EXPECT_EQ(ReadFile((*parts)[0]), "line0\nline1\nline2\n");
    EXPECT_EQ(ReadFile((*parts)[1]), "line3\nline4\nline5\n");
    EXPECT_EQ(ReadFile((*parts)[2]), "line6\n");
}

TEST(HashSplit, ExactMultipleHasNoEmptyPart) {
    TempDirectory dir("split-exact");
    auto input = dir.Write("dump.txt", "a\nb\nc\nd\n");
    auto parts = SplitFile(input, dir.GetPath() / "parts", 2);
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->size(), 2);
}

TEST(HashSplit, Errors) {
    TempDirectory dir("split-errors");
    auto input = dir.Write("dump.txt", "a\n");
    EXPECT_FALSE(SplitFile(input, dir.GetPath() / "parts", 0).has_value());
    EXPECT_FALSE(SplitFile(dir.GetPath() / "missing.txt", dir.GetPath() / "parts").has_value());
}
