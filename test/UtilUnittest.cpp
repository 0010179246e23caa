#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "Util.hpp"

TEST(Util, Hex) {
    const uint8_t bytes[] = { 0x00, 0x7f, 0xab, 0xff };
    EXPECT_EQ(Util::ToHex(bytes, sizeof(bytes)), "007fabff");
    EXPECT_TRUE(Util::IsHex("0123456789abcdefABCDEF"));
    EXPECT_FALSE(Util::IsHex("xyz"));
    EXPECT_FALSE(Util::IsHex(""));
}

TEST(Util, Strings) {
    EXPECT_EQ(Util::ToLower("AbC123"), "abc123");
    EXPECT_EQ(Util::Trim("  hash\r\n"), "hash");
    EXPECT_EQ(Util::Trim(" \t "), "");
}

TEST(Util, Hexlify) {
    EXPECT_EQ(Util::Hexlify("password"), "password");
    EXPECT_EQ(Util::Hexlify("pa:ss"), "$HEX[70613a7373]");
    EXPECT_EQ(Util::Hexlify("\xff"), "$HEX[ff]");
}
