// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SampleObjects.hxx"
#include "FormatErrorCode.hxx"
#include "safe-markup/Markup.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace SafeMarkup;

TEST(Format, Basic)
{
	EXPECT_EQ(Markup{"<em>{}</em>"}.Format("foo & bar"),
		  "<em>foo &amp; bar</em>");
	EXPECT_EQ(Markup{"{0} {1} {0}"}.Format("<", Markup{"<b>"}),
		  "&lt; <b> &lt;");
	EXPECT_EQ(Markup{"{} {} {}"}.Format(true, 2.5, 7), "true 2.5 7");
	EXPECT_EQ(Markup{"{{}} {}"}.Format(1), "{} 1");
	EXPECT_EQ(Markup{"}}{{"}.Format(), "}{");
	EXPECT_EQ(Markup{"<p>"}.Format(), "<p>");
}

TEST(Format, Named)
{
	EXPECT_EQ(Markup{"<a href=\"{url}\">{0}</a>"}.Format("<x>", Arg("url", "a\"b")),
		  "<a href=\"a&#34;b\">&lt;x&gt;</a>");
	EXPECT_EQ(Markup{"{a}-{b}"}.FormatMap({{"a", "<"}, {"b", Markup{"<i>"}}}),
		  "&lt;-<i>");
	EXPECT_EQ(Markup{"{0}{x}"}.VFormat({"<"}, {{"x", ">"}}),
		  "&lt;&gt;");
}

TEST(Format, Spec)
{
	EXPECT_EQ(Markup{"{:>5}"}.Format("<"), "    &lt;");
	EXPECT_EQ(Markup{"{:.2f}"}.Format(3.14159), "3.14");
	EXPECT_EQ(Markup{"{:05d}"}.Format(42), "00042");
	EXPECT_EQ(Markup{"{:x}"}.Format(255), "ff");

	/* nested fields in the specification */
	EXPECT_EQ(Markup{"{:>{}}"}.Format("a", 3), "  a");
	EXPECT_EQ(Markup{"{0:{1}}"}.Format(5, "03"), "005");
}

TEST(Format, FieldChain)
{
	EXPECT_EQ(Markup{"{0.name}"}.Format(Person{"<Bob>"}), "&lt;Bob&gt;");
	EXPECT_EQ(Markup{"{0[1]} {0[2][k]}"}.Format(ValueList{"a", "<", ValueMap{{"k", 5}}}),
		  "&lt; 5");
	EXPECT_EQ(Markup{"{m[key]}"}.Format(Arg("m", ValueMap{{"key", "<"}})),
		  "&lt;");
	EXPECT_EQ(Markup{"{0[href]}"}.Format(Link{"/a?b&c"}), "/a?b&amp;c");
	EXPECT_EQ(Markup{"{[0]}"}.Format(ValueList{"<"}), "&lt;");
}

TEST(Format, Conversion)
{
	/* the conversion drops the safety */
	EXPECT_EQ(Markup{"{0!s}"}.Format(Markup{"<b>"}), "&lt;b&gt;");
	EXPECT_EQ(Markup{"{0!r:>4}"}.Format("<"), "   &lt;");
	EXPECT_EQ(Markup{"{0!s}"}.Format(Link{"/a"}), "/a");
}

TEST(Format, Renderable)
{
	EXPECT_EQ(Markup{"{}"}.Format(BoldWidget{}), "<b>bold</b>");
	EXPECT_EQ(Markup{"{}"}.Format(Link{"/a"}), "<a>link</a>");
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{:>3}"}.Format(BoldWidget{}); }),
		  FormatErrorCode::SPEC);
}

TEST(Format, FormatRenderable)
{
	EXPECT_EQ(Markup{"{0:link}"}.Format(UserWidget{}),
		  "<a href=\"/user/1\">user</a>");
	EXPECT_EQ(Markup{"{0}"}.Format(UserWidget{}), "<span>user</span>");

	/* errors from the object reach the caller unchanged */
	EXPECT_THROW(Markup{"{0:foo}"}.Format(UserWidget{}),
		     std::invalid_argument);
}

TEST(Format, Errors)
{
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{"}.Format(); }),
		  FormatErrorCode::SYNTAX);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"}"}.Format(); }),
		  FormatErrorCode::SYNTAX);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{} {0}"}.Format(1, 2); }),
		  FormatErrorCode::SYNTAX);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{0} {}"}.Format(1, 2); }),
		  FormatErrorCode::SYNTAX);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{0!x}"}.Format(1); }),
		  FormatErrorCode::SYNTAX);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{0[}"}.Format(1); }),
		  FormatErrorCode::SYNTAX);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{0.}"}.Format(1); }),
		  FormatErrorCode::SYNTAX);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{:{:{}}}"}.Format(1, 2, 3); }),
		  FormatErrorCode::SYNTAX);

	EXPECT_EQ(CatchFormatError([]{ return Markup{"{1}"}.Format(1); }),
		  FormatErrorCode::MISSING_ARGUMENT);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{} {}"}.Format(1); }),
		  FormatErrorCode::MISSING_ARGUMENT);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{x}"}.Format(); }),
		  FormatErrorCode::MISSING_ARGUMENT);

	EXPECT_EQ(CatchFormatError([]{ return Markup{"{0[5]}"}.Format(ValueList{1}); }),
		  FormatErrorCode::LOOKUP);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{0[a]}"}.Format(ValueList{1}); }),
		  FormatErrorCode::LOOKUP);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{0[b]}"}.Format(ValueMap{{"a", 1}}); }),
		  FormatErrorCode::LOOKUP);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{0.foo}"}.Format(1); }),
		  FormatErrorCode::LOOKUP);
	EXPECT_EQ(CatchFormatError([]{ return Markup{"{0.age}"}.Format(Person{"x"}); }),
		  FormatErrorCode::LOOKUP);

	EXPECT_EQ(CatchFormatError([]{ return Markup{"{:q}"}.Format(1); }),
		  FormatErrorCode::SPEC);
}
