// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "text/TextOps.hxx"
#include "text/Utf8.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

template<typename C>
static std::vector<std::string>
ToStrings(const C &c)
{
	return std::vector<std::string>(c.begin(), c.end());
}

TEST(TextOps, Utf8)
{
	EXPECT_EQ(LengthUTF8(""), 0u);
	EXPECT_EQ(LengthUTF8("a\xc3\xa4\xe2\x82\xac\xf0\x9f\x98\x80"), 4u);

	std::string s;
	AppendUTF8(s, U'\u00e4');
	AppendUTF8(s, U'\U0001F600');
	EXPECT_EQ(s, "\xc3\xa4\xf0\x9f\x98\x80");
}

TEST(TextOps, Case)
{
	EXPECT_EQ(UpperUnicode("ab\xc3\xa4"), "AB\xc3\x84");
	EXPECT_EQ(UpperUnicode("stra\xc3\x9f" "e"), "STRASSE");
	EXPECT_EQ(LowerUnicode("\xc3\x84" "BC"), "\xc3\xa4" "bc");
	EXPECT_EQ(TitleUnicode("hello wORLD"), "Hello World");
	EXPECT_EQ(TitleUnicode("they're"), "They'Re");
	EXPECT_EQ(TitleUnicode("\xc3\xa9t\xc3\xa9 \xc3\xa0"), "\xc3\x89t\xc3\xa9 \xc3\x80");
	EXPECT_EQ(CapitalizeUnicode(""), "");
	EXPECT_EQ(CapitalizeUnicode("\xc3\xa9COLE"), "\xc3\x89" "cole");
	EXPECT_EQ(SwapCaseUnicode("a\xc3\x84"), "A\xc3\xa4");
}

TEST(TextOps, CaseMalformed)
{
	/* bytes which are not valid UTF-8 are copied */
	EXPECT_EQ(SwapCaseUnicode("a\xff" "B"), "A\xff" "b");
	EXPECT_EQ(TitleUnicode("x\xc3"), "X\xc3");
}

TEST(TextOps, Strip)
{
	EXPECT_EQ(StripWhitespace(" \t a \n"), "a"sv);
	EXPECT_EQ(StripCharacters("\xc3\xa4\xc3\xa4x\xc3\xa4", "\xc3\xa4"), "x"sv);
	EXPECT_EQ(StripCharacters("abcba", "ab", StripSide::LEFT), "cba"sv);
}

TEST(TextOps, Replace)
{
	EXPECT_EQ(ReplaceAll("aaa", "a", "b"), "bbb");
	EXPECT_EQ(ReplaceAll("aaa", "a", "b", 2), "bba");
	EXPECT_EQ(ReplaceAll("ab", "", "-"), "-a-b-");
	EXPECT_EQ(ReplaceAll("ab", "", "-", 2), "-a-b");
}

TEST(TextOps, Pad)
{
	EXPECT_EQ(PadString("\xc3\xa4", 3, "*", PadAlign::CENTER), "*\xc3\xa4*");
	EXPECT_EQ(PadString("ab", 5, "\xc3\xa4", PadAlign::LEFT),
		  "ab\xc3\xa4\xc3\xa4\xc3\xa4");
	EXPECT_THROW(PadString("a", 3, "", PadAlign::LEFT), std::invalid_argument);
	EXPECT_THROW(PadString("a", 3, "ab", PadAlign::LEFT), std::invalid_argument);

	EXPECT_EQ(ZeroFill("42", 5), "00042");
	EXPECT_EQ(ZeroFill("+5", 3), "+05");
	EXPECT_EQ(ExpandTabs("ab\tc"), "ab      c");
	EXPECT_EQ(ExpandTabs("a\n\tb", 2), "a\n  b");
}

TEST(TextOps, Split)
{
	EXPECT_EQ(ToStrings(SplitWhitespace("  a b  c ")),
		  (std::vector<std::string>{"a", "b", "c"}));
	EXPECT_EQ(ToStrings(SplitWhitespace("a b c", 1)),
		  (std::vector<std::string>{"a", "b c"}));
	EXPECT_EQ(ToStrings(RSplitWhitespace("a b c", 1)),
		  (std::vector<std::string>{"a b", "c"}));
	EXPECT_TRUE(SplitWhitespace("   ").empty());

	EXPECT_EQ(ToStrings(SplitString("a,,b", ",")),
		  (std::vector<std::string>{"a", "", "b"}));
	EXPECT_EQ(ToStrings(RSplitString("a,b,c", ",", 1)),
		  (std::vector<std::string>{"a,b", "c"}));
	EXPECT_THROW(SplitString("a", ""), std::invalid_argument);
	EXPECT_THROW(PartitionString("a", ""), std::invalid_argument);
}

TEST(TextOps, SplitLines)
{
	EXPECT_EQ(ToStrings(SplitLines("a\nb\rc\r\nd")),
		  (std::vector<std::string>{"a", "b", "c", "d"}));
	EXPECT_EQ(ToStrings(SplitLines("a\xe2\x80\xa8" "b\xc2\x85" "c\x1d" "d")),
		  (std::vector<std::string>{"a", "b", "c", "d"}));
	EXPECT_EQ(ToStrings(SplitLines("a\n\nb\n", true)),
		  (std::vector<std::string>{"a\n", "\n", "b\n"}));
	EXPECT_TRUE(SplitLines("").empty());
}

TEST(TextOps, CollapseWhitespace)
{
	EXPECT_EQ(CollapseWhitespace(" a \n\t b "), "a b");
	EXPECT_EQ(CollapseWhitespace(""), "");
}
