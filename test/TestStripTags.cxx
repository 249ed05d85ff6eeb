// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TagStripper.hxx"

#include <gtest/gtest.h>

TEST(StripTags, Comments)
{
	EXPECT_EQ(StripTags("<!-- outer comment --><em>Foo &amp; Bar <!-- inner comment about <em> -->\n </em><!-- comment\nwith\nnewlines\n--><meta content='tag\nwith\nnewlines'>"),
		  "Foo & Bar");
	EXPECT_EQ(StripTags("a<!---->b"), "ab");
	EXPECT_EQ(StripTags("a<!-- x -- y -->b"), "ab");
	EXPECT_EQ(StripTags("a<!-- -> -->b"), "ab");
}

TEST(StripTags, Elements)
{
	EXPECT_EQ(StripTags("<p>a</p>  <p>b</p>"), "a b");
	EXPECT_EQ(StripTags("<br/>x<br />"), "x");
	EXPECT_EQ(StripTags("a<>b"), "ab");
	EXPECT_EQ(StripTags("plain text"), "plain text");
	EXPECT_EQ(StripTags(""), "");
}

TEST(StripTags, Attributes)
{
	EXPECT_EQ(StripTags("<a title=\"x>y\">link</a>"), "link");
	EXPECT_EQ(StripTags("<a title='\"'>q</a>"), "q");
	EXPECT_EQ(StripTags("<a href=x>y</a>"), "y");
	EXPECT_EQ(StripTags("<a href = 'x>y' >z</a>"), "z");
}

TEST(StripTags, Declarations)
{
	EXPECT_EQ(StripTags("<!DOCTYPE html><p>x</p>"), "x");
	EXPECT_EQ(StripTags("<!DOCTYPE x \"a>b\">t"), "t");
	EXPECT_EQ(StripTags("<!>t"), "t");
	EXPECT_EQ(StripTags("<!-x>t"), "t");
}

TEST(StripTags, Whitespace)
{
	EXPECT_EQ(StripTags("  a \t\n b  "), "a b");
	EXPECT_EQ(StripTags("<p>\n</p>"), "");
}

TEST(StripTags, Entities)
{
	/* references are decoded after tags have been removed */
	EXPECT_EQ(StripTags("&lt;b&gt;x&lt;/b&gt;"), "<b>x</b>");
	EXPECT_EQ(StripTags("a&nbsp;b"), "a\xc2\xa0" "b");
}

TEST(StripTags, Unterminated)
{
	EXPECT_EQ(StripTags("a <b"), "a <b");
	EXPECT_EQ(StripTags("x <!-- y"), "x <!-- y");
	EXPECT_EQ(StripTags("<a title=\"x>"), "<a title=\"x>");
}

TEST(StripTags, Chunked)
{
	TagStripper stripper;
	stripper.Feed("<em>Fo");
	EXPECT_FALSE(stripper.IsInsideMarkup());
	stripper.Feed("o</e");
	EXPECT_TRUE(stripper.IsInsideMarkup());
	stripper.Feed("m> <!-");
	stripper.Feed("- c -");
	EXPECT_TRUE(stripper.IsInsideMarkup());
	stripper.Feed("->bar");
	EXPECT_FALSE(stripper.IsInsideMarkup());
	EXPECT_EQ(stripper.Finish(), "Foo bar");
}

TEST(StripTags, FreshStripper)
{
	TagStripper empty;
	EXPECT_FALSE(empty.IsInsideMarkup());
	EXPECT_EQ(empty.Finish(), "");

	TagStripper stripper;
	stripper.Feed("<!--");
	stripper.Feed("-");
	EXPECT_TRUE(stripper.IsInsideMarkup());
	stripper.Feed("->x");
	EXPECT_EQ(stripper.Finish(), "x");
}
