// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SampleObjects.hxx"
#include "safe-markup/Markup.hxx"

#include <gtest/gtest.h>

#include <climits>
#include <sstream>
#include <stdexcept>

using namespace SafeMarkup;

template<typename C>
static std::vector<std::string>
ToStrings(const C &c)
{
	std::vector<std::string> result;
	for (const Markup &i : c)
		result.push_back(i.GetText());
	return result;
}

TEST(Markup, Construct)
{
	const Markup m{"<em>x</em>"};
	EXPECT_EQ(m.GetText(), "<em>x</em>");
	EXPECT_EQ(m.ToMarkup(), m);
	EXPECT_EQ(m.size(), 10u);
	EXPECT_FALSE(m.empty());
	EXPECT_TRUE(Markup{}.empty());
}

TEST(Markup, Concatenate)
{
	const Markup em{"<em>"};

	EXPECT_EQ(em + "<foo>", "<em>&lt;foo&gt;");
	EXPECT_EQ("<foo>" + em, "&lt;foo&gt;<em>");
	EXPECT_EQ(em + em, "<em><em>");
	EXPECT_EQ(em + 1, "<em>1");
	EXPECT_EQ(em + BoldWidget{}, "<em><b>bold</b>");

	Markup m{"<p>"};
	m += "&";
	m += Markup{"</p>"};
	EXPECT_EQ(m, "<p>&amp;</p>");
}

TEST(Markup, Repeat)
{
	const Markup br{"<br>"};
	EXPECT_EQ(br * 2, "<br><br>");
	EXPECT_EQ(3 * Markup{"a"}, "aaa");
	EXPECT_EQ(br.Repeat(0), "");

	/* negative counts yield an empty string */
	EXPECT_EQ(br * -1, "");
	EXPECT_EQ(-5 * Markup{"a"}, "");
	EXPECT_EQ(Markup{}.Repeat(LLONG_MAX), "");

	EXPECT_THROW(Markup{"ab"}.Repeat(LLONG_MAX), std::length_error);
}

TEST(Markup, Case)
{
	EXPECT_EQ(Markup{"<em>Hello</em>"}.Upper(), "<EM>HELLO</EM>");
	EXPECT_EQ(Markup{"HeLLo &AMP;"}.Lower(), "hello &amp;");
	EXPECT_EQ(Markup{"hELLO wORLD"}.Capitalize(), "Hello world");
	EXPECT_EQ(Markup{"hello wORLD"}.Title(), "Hello World");
	EXPECT_EQ(Markup{"aB"}.SwapCase(), "Ab");

	/* case mapping covers all of Unicode */
	EXPECT_EQ(Markup{"<i>\xc3\xa9l\xc3\xa8ve</i>"}.Upper(),
		  "<I>\xc3\x89L\xc3\x88VE</I>");
}

TEST(Markup, Strip)
{
	EXPECT_EQ(Markup{"  <br>  "}.Strip(), "<br>");
	EXPECT_EQ(Markup{"  <br>  "}.LStrip(), "<br>  ");
	EXPECT_EQ(Markup{"  <br>  "}.RStrip(), "  <br>");

	/* the character set is escaped first */
	EXPECT_EQ(Markup{"&lt;x&lt;"}.Strip("<"), "x");
	EXPECT_EQ(Markup{"xxaxx"}.LStrip("x"), "axx");
	EXPECT_EQ(Markup{"xxaxx"}.RStrip(Markup{"x"}), "xxa");
}

TEST(Markup, Replace)
{
	EXPECT_EQ(Markup{"a-b-c"}.Replace("-", "<"), "a&lt;b&lt;c");
	EXPECT_EQ(Markup{"a-b-c"}.Replace("-", Markup{"<br>"}, 1), "a<br>b-c");
	EXPECT_EQ(Markup{"a&lt;b"}.Replace("<", ">"), "a&gt;b");
}

TEST(Markup, Pad)
{
	EXPECT_EQ(Markup{"ab"}.Center(6), "  ab  ");
	EXPECT_EQ(Markup{"ab"}.Center(5, "*"), "**ab*");
	EXPECT_EQ(Markup{"ab"}.LJust(4, "-"), "ab--");
	EXPECT_EQ(Markup{"ab"}.RJust(4), "  ab");
	EXPECT_EQ(Markup{"abc"}.RJust(2), "abc");
	EXPECT_EQ(Markup{"-42"}.ZFill(5), "-0042");

	/* an escaped fill character is longer than one character */
	EXPECT_THROW(Markup{"ab"}.Center(5, "<"), std::invalid_argument);
}

TEST(Markup, ExpandTabs)
{
	EXPECT_EQ(Markup{"a\tb"}.ExpandTabs(4), "a   b");
	EXPECT_EQ(Markup{"\t<b>"}.ExpandTabs(), "        <b>");
}

TEST(Markup, RemovePrefix)
{
	EXPECT_EQ(Markup{"<p>x</p>"}.RemovePrefix(Markup{"<p>"}), "x</p>");
	EXPECT_EQ(Markup{"<p>x</p>"}.RemovePrefix("<p>"), "<p>x</p>");
	EXPECT_EQ(Markup{"&lt;x"}.RemovePrefix("<"), "x");
	EXPECT_EQ(Markup{"x</p>"}.RemoveSuffix(Markup{"</p>"}), "x");
}

TEST(Markup, Partition)
{
	EXPECT_EQ(ToStrings(Markup{"a&lt;b&lt;c"}.Partition("<")),
		  (std::vector<std::string>{"a", "&lt;", "b&lt;c"}));
	EXPECT_EQ(ToStrings(Markup{"a&lt;b&lt;c"}.RPartition("<")),
		  (std::vector<std::string>{"a&lt;b", "&lt;", "c"}));
	EXPECT_EQ(ToStrings(Markup{"abc"}.Partition("-")),
		  (std::vector<std::string>{"abc", "", ""}));
}

TEST(Markup, Split)
{
	EXPECT_EQ(ToStrings(Markup{" a  <b> "}.Split()),
		  (std::vector<std::string>{"a", "<b>"}));
	EXPECT_EQ(ToStrings(Markup{"a b c"}.Split(1)),
		  (std::vector<std::string>{"a", "b c"}));
	EXPECT_EQ(ToStrings(Markup{"a b c"}.RSplit(1)),
		  (std::vector<std::string>{"a b", "c"}));
	EXPECT_EQ(ToStrings(Markup{"a,b,c"}.Split(",")),
		  (std::vector<std::string>{"a", "b", "c"}));
	EXPECT_EQ(ToStrings(Markup{"a,b,c"}.Split(",", 1)),
		  (std::vector<std::string>{"a", "b,c"}));
	EXPECT_EQ(ToStrings(Markup{"a,b,c"}.RSplit(",", 1)),
		  (std::vector<std::string>{"a,b", "c"}));

	/* the separator is escaped */
	EXPECT_EQ(ToStrings(Markup{"x&lt;y"}.Split("<")),
		  (std::vector<std::string>{"x", "y"}));

	EXPECT_THROW(Markup{"x"}.Split(""), std::invalid_argument);
}

TEST(Markup, SplitLines)
{
	EXPECT_EQ(ToStrings(Markup{"a\nb\r\nc"}.SplitLines()),
		  (std::vector<std::string>{"a", "b", "c"}));
	EXPECT_EQ(ToStrings(Markup{"a\nb\r\nc"}.SplitLines(true)),
		  (std::vector<std::string>{"a\n", "b\r\n", "c"}));
}

TEST(Markup, Join)
{
	EXPECT_EQ(Markup{"<br>"}.Join({"<a>", Markup{"<b>"}, 3}),
		  "&lt;a&gt;<br><b><br>3");
	EXPECT_EQ(Markup{", "}.Join({}), "");
}

TEST(Markup, Output)
{
	const Markup m{"<b>&amp;</b>"};
	EXPECT_EQ(fmt::format("{}", m), "<b>&amp;</b>");
	EXPECT_EQ(fmt::format("[{:>6}]", Markup{"<b>"}), "[   <b>]");

	std::ostringstream os;
	os << m;
	EXPECT_EQ(os.str(), "<b>&amp;</b>");
}

TEST(Markup, StripTags)
{
	EXPECT_EQ(Markup{"<p>a &amp; b</p>\n<p>c</p>"}.StripTags(), "a & b c");
}
