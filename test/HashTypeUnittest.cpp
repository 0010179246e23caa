#include <gtest/gtest.h>

#include <string>

#include "HashType.hpp"

TEST(HashType, ParseNames) {
    EXPECT_EQ(ParseHashType("nt"), HashTypeNT);
    EXPECT_EQ(ParseHashType("ntlm"), HashTypeNT);
    EXPECT_EQ(ParseHashType("NTLM"), HashTypeNT);
    EXPECT_EQ(ParseHashType("lm"), HashTypeLM);
    EXPECT_EQ(ParseHashType("md5"), HashTypeMD5);
    EXPECT_EQ(ParseHashType("SHA1"), HashTypeSHA1);
    EXPECT_EQ(ParseHashType("sha256"), HashTypeSHA256);
    EXPECT_EQ(ParseHashType("md4"), HashTypeUndefined);
    EXPECT_EQ(ParseHashType(""), HashTypeUndefined);
}

TEST(HashType, WireNames) {
    EXPECT_STREQ(HashTypeToString(HashTypeNT), "nt");
    EXPECT_STREQ(HashTypeToString(HashTypeLM), "lm");
    EXPECT_STREQ(HashTypeToString(HashTypeSHA256), "sha256");
}

TEST(HashType, Lengths) {
    EXPECT_EQ(GetHexLength(HashTypeNT), 32);
    EXPECT_EQ(GetHexLength(HashTypeLM), 32);
    EXPECT_EQ(GetHexLength(HashTypeMD5), 32);
    EXPECT_EQ(GetHexLength(HashTypeSHA1), 40);
    EXPECT_EQ(GetHexLength(HashTypeSHA256), 64);
    EXPECT_EQ(GetHexLength(HashTypeUndefined), 0);
}

TEST(HashType, Shape) {
    EXPECT_TRUE(IsHashOfType("8846f7eaee8fb117ad06bdd830b7586c", HashTypeNT));
    EXPECT_TRUE(IsHashOfType("8846F7EAEE8FB117AD06BDD830B7586C", HashTypeNT));
    EXPECT_FALSE(IsHashOfType("66sd423103a39234df59ff82134ccfb20", HashTypeNT));
    EXPECT_FALSE(IsHashOfType("8846f7eaee8fb117ad06bdd830b7586c", HashTypeSHA1));
    EXPECT_FALSE(IsHashOfType("", HashTypeUndefined));
}
