// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SampleObjects.hxx"
#include "safe-markup/Escape.hxx"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using namespace SafeMarkup;

TEST(Escape, Text)
{
	EXPECT_EQ(Escape("foo bar"), "foo bar");
	EXPECT_EQ(Escape("<script>alert(\"x\")</script>"),
		  "&lt;script&gt;alert(&#34;x&#34;)&lt;/script&gt;");
	EXPECT_EQ(Escape("'&'"), "&#39;&amp;&#39;");
	EXPECT_EQ(Escape(std::string{"a<b"}), "a&lt;b");
	EXPECT_EQ(Escape(std::string_view{"a>b"}), "a&gt;b");

	/* existing entities are encoded again */
	EXPECT_EQ(Escape("&amp;"), "&amp;amp;");
}

TEST(Escape, Idempotent)
{
	const auto once = Escape("<em>");
	EXPECT_EQ(Escape(once), once);
	EXPECT_EQ(Escape(Escape(once)), "&lt;em&gt;");
	EXPECT_EQ(Escape(Markup{"<em>&amp;</em>"}), "<em>&amp;</em>");
}

TEST(Escape, NonText)
{
	EXPECT_EQ(Escape(42), "42");
	EXPECT_EQ(Escape(-7LL), "-7");
	EXPECT_EQ(Escape(1.5), "1.5");
	EXPECT_EQ(Escape(true), "true");
	EXPECT_EQ(Escape(ValueList{1, "a<"}), "[1, &#34;a&lt;&#34;]");
	EXPECT_EQ(Escape(ValueMap{{"k", nullptr}}), "{&#34;k&#34;: null}");
}

TEST(Escape, Renderable)
{
	EXPECT_EQ(Escape(BoldWidget{}), "<b>bold</b>");
	EXPECT_EQ(Escape(std::make_shared<BoldWidget>()), "<b>bold</b>");
	EXPECT_EQ(Escape(UserWidget{}), "<span>user</span>");
	EXPECT_EQ(Markup::FromRenderable(BoldWidget{}), "<b>bold</b>");
	EXPECT_EQ(Markup::FromRenderable("<"), "&lt;");
}

TEST(Escape, Object)
{
	/* plain objects are escaped */
	EXPECT_EQ(Escape(Person{"<Bob>"}), "Person &lt;Bob&gt;");

	/* objects which are also renderable are not */
	EXPECT_EQ(Escape(Link{"/a?b&c"}), "<a>link</a>");
}

TEST(Escape, Null)
{
	EXPECT_THROW(Escape(nullptr), std::invalid_argument);
	EXPECT_THROW(Escape(Value{}), std::invalid_argument);

	EXPECT_EQ(EscapeSilent(nullptr), "");
	EXPECT_TRUE(EscapeSilent(Value{}).empty());
	EXPECT_EQ(EscapeSilent("<"), "&lt;");
	EXPECT_EQ(EscapeSilent(Markup{"<br>"}), "<br>");
}

TEST(Escape, SoftText)
{
	const auto a = SoftText("<a>");
	ASSERT_TRUE(a.IsString());
	EXPECT_EQ(a.GetString(), "<a>");

	const auto b = SoftText(Markup{"<b>"});
	ASSERT_TRUE(b.IsMarkup());
	EXPECT_EQ(b.GetMarkup(), "<b>");

	const auto c = SoftText(BoldWidget{});
	ASSERT_TRUE(c.IsMarkup());
	EXPECT_EQ(c.GetMarkup(), "<b>bold</b>");

	const auto d = SoftText(5);
	ASSERT_TRUE(d.IsString());
	EXPECT_EQ(d.GetString(), "5");

	EXPECT_THROW(SoftText(nullptr), std::invalid_argument);
}

TEST(Escape, Unescape)
{
	EXPECT_EQ(Unescape("&lt;em&gt;"), "<em>");
	EXPECT_EQ(Escape("<em>").Unescape(), "<em>");
	EXPECT_EQ(Unescape(Escape("\"'&<>").GetText()), "\"'&<>");
}
