#include <gtest/gtest.h>

#include <string>
#include <unordered_set>
#include <vector>

#include "Fakes.hpp"
#include "HashExtractor.hpp"

#define HASH_A "a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4"
#define HASH_B "d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1"

TEST(HashExtractor, TwoTokensInOrder) {
    auto records = ExtractHashes(HASH_A " " HASH_B, HashTypeNT);
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].Hash, HASH_A);
    EXPECT_EQ(records[1].Hash, HASH_B);
    EXPECT_EQ(records[0].Type, HashTypeNT);
}

TEST(HashExtractor, Deduplicates) {
    HashExtractor extractor(HashTypeNT);
    extractor.Scan(HASH_A "\n" HASH_B "\n" HASH_A "\n");
    extractor.Scan(HASH_B);
    ASSERT_EQ(extractor.GetCount(), 2);
    EXPECT_EQ(extractor.GetDuplicates(), 2);
    EXPECT_EQ(extractor.GetRecords()[0].Hash, HASH_A);
    EXPECT_EQ(extractor.GetRecords()[1].Hash, HASH_B);
}

TEST(HashExtractor, CaseFoldsBeforeDeduplicating) {
    auto records = ExtractHashes("A1B2C3D4E5F6A1B2C3D4E5F6A1B2C3D4 " HASH_A, HashTypeNT);
    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0].Hash, HASH_A);
}

TEST(HashExtractor, PwdumpLine) {
    auto records = ExtractHashes(
        "Administrator:500:aad3b435b51404eeaad3b435b51404ee:8846f7eaee8fb117ad06bdd830b7586c:::\r\n",
        HashTypeNT
    );
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].Hash, "aad3b435b51404eeaad3b435b51404ee");
    EXPECT_EQ(records[1].Hash, "8846f7eaee8fb117ad06bdd830b7586c");
}

TEST(HashExtractor, WordBoundaries) {
    // Longer hex runs and hex glued to letters are not hashes
    EXPECT_TRUE(ExtractHashes(HASH_A "0", HashTypeNT).empty());
    EXPECT_TRUE(ExtractHashes("0" HASH_A, HashTypeNT).empty());
    EXPECT_TRUE(ExtractHashes("x" HASH_A, HashTypeNT).empty());
    EXPECT_TRUE(ExtractHashes(HASH_A "g", HashTypeNT).empty());
    EXPECT_TRUE(ExtractHashes("_" HASH_A, HashTypeNT).empty());
    EXPECT_TRUE(ExtractHashes(HASH_A HASH_B, HashTypeNT).empty());
    EXPECT_EQ(ExtractHashes("(" HASH_A ")", HashTypeNT).size(), 1);
    EXPECT_EQ(ExtractHashes("-" HASH_A ",", HashTypeNT).size(), 1);
    EXPECT_EQ(ExtractHashes(HASH_A, HashTypeNT).size(), 1);
}

TEST(HashExtractor, LengthFollowsType) {
    const std::string sha1 = "5baa61e4c9b93f3f0682250b6cf8331b7ee68fd8";
    auto records = ExtractHashes(sha1 + " " HASH_A, HashTypeSHA1);
    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0].Hash, sha1);
    EXPECT_TRUE(ExtractHashes(sha1, HashTypeNT).empty());
}

TEST(HashExtractor, EmptyInput) {
    EXPECT_TRUE(ExtractHashes("", HashTypeNT).empty());
    EXPECT_TRUE(ExtractHashes("no hashes in here", HashTypeNT).empty());
}

TEST(HashExtractor, EveryResultIsUniqueAndShaped) {
    std::string text;
    for (size_t i = 0; i < 50; i++)
    {
        text += "user" + std::to_string(i) + ":" + MakeHash(i % 20) + ":junk " + MakeHash(i) + "z\n";
    }
    auto records = ExtractHashes(text, HashTypeNT);
    EXPECT_EQ(records.size(), 20);
    std::unordered_set<std::string> seen;
    for (auto& record : records)
    {
        EXPECT_TRUE(IsHashOfType(record.Hash, HashTypeNT));
        EXPECT_TRUE(seen.insert(record.Hash).second);
    }
}

TEST(HashExtractor, ExtractFile) {
    TempDirectory dir("extract");
    auto path = dir.Write("dump.txt", "line one " HASH_B "\nline two " HASH_A "\n");
    HashExtractor extractor(HashTypeNT);
    auto records = extractor.ExtractFile(path);
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 2);
    EXPECT_EQ((*records)[0].Hash, HASH_B);
}

TEST(HashExtractor, MissingFile) {
    HashExtractor extractor(HashTypeNT);
    EXPECT_FALSE(extractor.ExtractFile("/nonexistent/hashlookup/dump.txt").has_value());
}

TEST(HashExtractor, WriteHashList) {
    TempDirectory dir("hashlist");
    auto records = ExtractHashes(HASH_A " " HASH_B, HashTypeNT);
    auto path = dir.GetPath() / "extracted.txt";
    ASSERT_TRUE(WriteHashList(path, records));
    EXPECT_EQ(ReadFile(path), HASH_A "\n" HASH_B "\n");
    EXPECT_FALSE(WriteHashList(dir.GetPath() / "missing" / "extracted.txt", records));
}
