#include <gtest/gtest.h>

#include <string>

#include "passgen/text_util.hpp"

TEST(TextUtilTest, TrimsBothEnds) {
    EXPECT_EQ(passgen::TrimAsciiWhitespace("  word\t"), "word");
    EXPECT_EQ(passgen::TrimAsciiWhitespace("line\r"), "line");
    EXPECT_EQ(passgen::TrimAsciiWhitespace("132\n"), "132");
}

TEST(TextUtilTest, KeepsInnerWhitespace) {
    EXPECT_EQ(passgen::TrimAsciiWhitespace(" two words "), "two words");
}

TEST(TextUtilTest, BlankInputBecomesEmpty) {
    EXPECT_EQ(passgen::TrimAsciiWhitespace(""), "");
    EXPECT_EQ(passgen::TrimAsciiWhitespace(" \t\r\n"), "");
}
