// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SampleObjects.hxx"
#include "FormatErrorCode.hxx"
#include "safe-markup/Markup.hxx"

#include <gtest/gtest.h>

using namespace SafeMarkup;

TEST(PercentFormat, Text)
{
	EXPECT_EQ(Markup{"<em>%s</em>"} % "foo & bar",
		  "<em>foo &amp; bar</em>");
	EXPECT_EQ((Markup{"<em>%s:%s</em>"} % ValueList{"foo & bar", Markup{"<foo>"}}),
		  "<em>foo &amp; bar:<foo></em>");
	EXPECT_EQ((Markup{"%r|%a"} % ValueList{"<", "'"}), "&lt;|&#39;");
	EXPECT_EQ(Markup{"%s"} % BoldWidget{}, "<b>bold</b>");
	EXPECT_EQ(Markup{"%s"} % 42, "42");
	EXPECT_EQ(Markup{"no directives"} % ValueList{}, "no directives");
	EXPECT_EQ(Markup{"<b>%s</b>"}.PercentFormat("<"), "<b>&lt;</b>");
}

TEST(PercentFormat, Mapping)
{
	EXPECT_EQ((Markup{"<em>%(username)s</em>"} % ValueMap{{"username", "<bar>"}}),
		  "<em>&lt;bar&gt;</em>");
	EXPECT_EQ((Markup{"%(a)s %(b)d %(a)s"} % ValueMap{{"a", "<"}, {"b", 2}}),
		  "&lt; 2 &lt;");

	/* the mapping is the positional argument */
	EXPECT_EQ((Markup{"%s"} % ValueMap{{"a", 1}}), "{&#34;a&#34;: 1}");
}

TEST(PercentFormat, Width)
{
	/* width and precision count the escaped characters */
	EXPECT_EQ(Markup{"[%5s]"} % "<", "[ &lt;]");
	EXPECT_EQ(Markup{"[%-3s]"} % "a", "[a  ]");
	EXPECT_EQ(Markup{"[%.2s]"} % "<<<", "[&l]");
	EXPECT_EQ(Markup{"[%5s]"} % Markup{"<b>"}, "[  <b>]");
	EXPECT_EQ(Markup{"[%3c]"} % "&", "[&amp;]");
	EXPECT_EQ((Markup{"[%*s]"} % ValueList{3, "a"}), "[  a]");
	EXPECT_EQ((Markup{"[%-*s]"} % ValueList{3, "a"}), "[a  ]");
	EXPECT_EQ((Markup{"[%*d]"} % ValueList{-3, 1}), "[1  ]");
	EXPECT_EQ((Markup{"[%.*s]"} % ValueList{1, "ab"}), "[a]");
}

TEST(PercentFormat, Integer)
{
	EXPECT_EQ(Markup{"%d"} % 42, "42");
	EXPECT_EQ(Markup{"%i"} % -1, "-1");
	EXPECT_EQ(Markup{"%u"} % true, "1");
	EXPECT_EQ(Markup{"%ld"} % 7, "7");
	EXPECT_EQ(Markup{"%05d"} % -42, "-0042");
	EXPECT_EQ(Markup{"%+d"} % 5, "+5");
	EXPECT_EQ(Markup{"% d"} % 5, " 5");
	EXPECT_EQ(Markup{"%.3d"} % 5, "005");
	EXPECT_EQ(Markup{"%-4d|"} % 5, "5   |");
	EXPECT_EQ(Markup{"%d"} % 3.9, "3");
	EXPECT_EQ(Markup{"%d"} % -3.9, "-3");
	EXPECT_EQ(Markup{"%d"} % -0x1p63, "-9223372036854775808");
	EXPECT_EQ(Markup{"%d"} % 9223372036854774784.0,
		  "9223372036854774784");

	EXPECT_EQ(Markup{"%x"} % 255, "ff");
	EXPECT_EQ(Markup{"%X"} % 255, "FF");
	EXPECT_EQ(Markup{"%#x"} % 255, "0xff");
	EXPECT_EQ(Markup{"%#X"} % 255, "0XFF");
	EXPECT_EQ(Markup{"%o"} % 8, "10");
	EXPECT_EQ(Markup{"%#o"} % 8, "0o10");
	EXPECT_EQ(Markup{"%#06x"} % 255, "0x00ff");
	EXPECT_EQ(Markup{"%x"} % -255, "-ff");
}

TEST(PercentFormat, Float)
{
	EXPECT_EQ(Markup{"%.2f"} % 3.14159, "3.14");
	EXPECT_EQ(Markup{"%f"} % 1, "1.000000");
	EXPECT_EQ(Markup{"%6.1f"} % 1.23, "   1.2");
	EXPECT_EQ(Markup{"%-6.1f|"} % 1.23, "1.2   |");
	EXPECT_EQ(Markup{"%+.1f"} % 1.23, "+1.2");
	EXPECT_EQ(Markup{"%e"} % 12345.678, "1.234568e+04");
	EXPECT_EQ(Markup{"%E"} % 12345.678, "1.234568E+04");
	EXPECT_EQ(Markup{"%g"} % 0.5, "0.5");
}

TEST(PercentFormat, Character)
{
	EXPECT_EQ(Markup{"%c"} % 65, "A");
	EXPECT_EQ(Markup{"%c"} % 0xfc, "\xc3\xbc");
	EXPECT_EQ(Markup{"%c"} % "<", "&lt;");
	EXPECT_EQ(Markup{"%c"} % Markup{"x"}, "x");
}

TEST(PercentFormat, Percent)
{
	EXPECT_EQ(Markup{"100%% <b>%s</b>"} % "x", "100% <b>x</b>");
	EXPECT_EQ(Markup{"%%"} % ValueList{}, "%");
}

TEST(PercentFormat, Errors)
{
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%s %s"} % "a"; }),
		  FormatErrorCode::MISSING_ARGUMENT);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%s"} % ValueList{}; }),
		  FormatErrorCode::MISSING_ARGUMENT);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%s"} % ValueList{"a", "b"}; }),
		  FormatErrorCode::UNUSED_ARGUMENTS);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"foo"} % "x"; }),
		  FormatErrorCode::UNUSED_ARGUMENTS);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%(x)s"} % "a"; }),
		  FormatErrorCode::TYPE);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%(x)s"} % ValueMap{}; }),
		  FormatErrorCode::MISSING_ARGUMENT);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%d"} % "x"; }),
		  FormatErrorCode::TYPE);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%x"} % 1.5; }),
		  FormatErrorCode::TYPE);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%f"} % "x"; }),
		  FormatErrorCode::TYPE);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%c"} % "ab"; }),
		  FormatErrorCode::TYPE);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%*s"} % ValueList{"a", "b"}; }),
		  FormatErrorCode::TYPE);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%q"} % 1; }),
		  FormatErrorCode::SYNTAX);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"abc %"} % 1; }),
		  FormatErrorCode::SYNTAX);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%(x"} % ValueMap{}; }),
		  FormatErrorCode::SYNTAX);
}

TEST(PercentFormat, IntegerRange)
{
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%d"} % 0x1p63; }),
		  FormatErrorCode::TYPE);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%d"} % 9.25e18; }),
		  FormatErrorCode::TYPE);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%d"} % -9.25e18; }),
		  FormatErrorCode::TYPE);
}

TEST(PercentFormat, FieldTooBig)
{
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%.99999999999f"} % 1.5; }),
		  FormatErrorCode::SPEC);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"%99999999999s"} % "a"; }),
		  FormatErrorCode::SPEC);
	EXPECT_EQ(CatchFormatError([]{
		return Markup{"%*s"} % ValueList{3000000000LL, "a"};
	}), FormatErrorCode::SPEC);
}
