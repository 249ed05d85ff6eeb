// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "escape/HTML.hxx"
#include "escape/String.hxx"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

static std::string
html_escape(std::string_view p)
{
	return escape_string(html_escape_class, p);
}

static std::string
html_unescape(std::string_view p)
{
	return unescape_string(html_escape_class, p);
}

TEST(HtmlEscape, Escape)
{
	ASSERT_EQ(html_escape(""), "");
	ASSERT_EQ(html_escape("foo bar"), "foo bar");
	ASSERT_EQ(html_escape("<a href=\"x\">'&'</a>"),
		  "&lt;a href=&#34;x&#34;&gt;&#39;&amp;&#39;&lt;/a&gt;");
	ASSERT_EQ(html_escape("&amp;"), "&amp;amp;");
	ASSERT_EQ(html_escape("\xc3\xbc<"), "\xc3\xbc&lt;");
}

TEST(HtmlEscape, Basic)
{
	ASSERT_EQ(html_unescape("foo bar"), "foo bar");
	ASSERT_EQ(html_unescape("foo&amp;bar"), "foo&bar");
	ASSERT_EQ(html_unescape("&lt;&gt;"), "<>");
	ASSERT_EQ(html_unescape("&quot;"), "\"");
	ASSERT_EQ(html_unescape("&amp;amp;"), "&amp;");
	ASSERT_EQ(html_unescape("&amp;&&quot;"), "&&\"");
	ASSERT_EQ(html_unescape("&gt&lt;&apos;"), "><'");
	ASSERT_EQ(html_unescape("&lt;foo&gt;bar&apos;"), "<foo>bar'");
	ASSERT_EQ(html_unescape("&quot"), "\"");
	ASSERT_EQ(html_unescape("&AMP;"), "&");
	ASSERT_EQ(html_unescape("&"), "&");
	ASSERT_EQ(html_unescape("a & b"), "a & b");
	ASSERT_EQ(html_unescape("&&"), "&&");
}

TEST(HtmlEscape, Numeric)
{
	ASSERT_EQ(html_unescape("&#10;"), "\n");
	ASSERT_EQ(html_unescape("&#xa;"), "\n");
	ASSERT_EQ(html_unescape("&#Xa;"), "\n");
	ASSERT_EQ(html_unescape("&#65"), "A");
	ASSERT_EQ(html_unescape("&#x41;B"), "AB");
	ASSERT_EQ(html_unescape("&#xfc;"), "\xc3\xbc");
	ASSERT_EQ(html_unescape("&#x1F600;"), "\xf0\x9f\x98\x80");
	ASSERT_EQ(html_unescape("&#13;"), "\r");

	/* replaced */
	ASSERT_EQ(html_unescape("&#0;"), "\xef\xbf\xbd");
	ASSERT_EQ(html_unescape("&#xd800;"), "\xef\xbf\xbd");
	ASSERT_EQ(html_unescape("&#x110000;"), "\xef\xbf\xbd");
	ASSERT_EQ(html_unescape("&#99999999999999999999;"), "\xef\xbf\xbd");

	/* windows-1252 */
	ASSERT_EQ(html_unescape("&#x80;"), "\xe2\x82\xac");
	ASSERT_EQ(html_unescape("&#150;"), "\xe2\x80\x93");

	/* dropped */
	ASSERT_EQ(html_unescape("a&#1;b"), "ab");
	ASSERT_EQ(html_unescape("&#x10ffff;"), "");
	ASSERT_EQ(html_unescape("&#xfffe;"), "");

	/* not a reference */
	ASSERT_EQ(html_unescape("&#;"), "&#;");
	ASSERT_EQ(html_unescape("&#x;"), "&#x;");
	ASSERT_EQ(html_unescape("&#xg;"), "&#xg;");
}

TEST(HtmlEscape, Named)
{
	ASSERT_EQ(html_unescape("&copy; 2024"), "\xc2\xa9 2024");
	ASSERT_EQ(html_unescape("&euro;"), "\xe2\x82\xac");
	ASSERT_EQ(html_unescape("&nGt;"), "\xe2\x89\xab\xe2\x83\x92");

	/* legacy names work without semicolon, also as prefix */
	ASSERT_EQ(html_unescape("&copy"), "\xc2\xa9");
	ASSERT_EQ(html_unescape("&ltfoo"), "<foo");
	ASSERT_EQ(html_unescape("&notit;"), "\xc2\xacit;");

	/* names which require a semicolon */
	ASSERT_EQ(html_unescape("&euro"), "&euro");
	ASSERT_EQ(html_unescape("&apos"), "&apos");

	ASSERT_EQ(html_unescape("&unknown;"), "&unknown;");
	ASSERT_EQ(html_unescape("&foo&#x3b;"), "&foo;");
}

TEST(HtmlEscape, FixedPoint)
{
	/* decoding the quirky input again does not change it */
	const auto once = html_unescape("&foo&#x3b;");
	ASSERT_EQ(html_unescape(once), once);

	const auto s = html_unescape("&amp;lt;");
	ASSERT_EQ(s, "&lt;");
	ASSERT_EQ(html_unescape(html_escape(s)), s);
}
