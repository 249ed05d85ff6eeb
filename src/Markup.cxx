// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "safe-markup/Markup.hxx"
#include "safe-markup/Escape.hxx"
#include "Operand.hxx"
#include "PercentFormat.hxx"
#include "Formatter.hxx"
#include "TagStripper.hxx"
#include "text/TextOps.hxx"

#include <ostream>
#include <stdexcept>

namespace SafeMarkup {

template<typename L>
static std::vector<Markup>
ToMarkupVector(const L &list)
{
	std::vector<Markup> result;
	result.reserve(list.size());
	for (const std::string_view i : list)
		result.emplace_back(i);
	return result;
}

static std::array<Markup, 3>
ToMarkupArray(const std::array<std::string_view, 3> &a)
{
	return {Markup{a[0]}, Markup{a[1]}, Markup{a[2]}};
}

Markup &
Markup::operator+=(const Value &other)
{
	text += EscapeOperand(other);
	return *this;
}

Markup
Markup::Repeat(long long n) const
{
	if (n <= 0 || text.empty())
		return {};

	const auto count = static_cast<unsigned long long>(n);
	if (count > text.max_size() / text.size())
		throw std::length_error("Repeated markup too long");

	std::string result;
	result.reserve(text.size() * count);
	for (unsigned long long i = 0; i < count; ++i)
		result += text;
	return Markup{std::move(result)};
}

Markup
Markup::PercentFormat(const Value &args) const
{
	return Markup{SafeMarkup::PercentFormat(text, args)};
}

Markup
Markup::VFormat(const ValueList &args, const ValueMap &kwargs) const
{
	return Markup{FormatFields(text, args, kwargs)};
}

Markup
Markup::FormatMap(const ValueMap &mapping) const
{
	return VFormat({}, mapping);
}

std::string
Markup::Unescape() const
{
	return SafeMarkup::Unescape(text);
}

std::string
Markup::StripTags() const
{
	return ::StripTags(text);
}

Markup
Markup::Upper() const
{
	return Markup{UpperUnicode(text)};
}

Markup
Markup::Lower() const
{
	return Markup{LowerUnicode(text)};
}

Markup
Markup::Capitalize() const
{
	return Markup{CapitalizeUnicode(text)};
}

Markup
Markup::Title() const
{
	return Markup{TitleUnicode(text)};
}

Markup
Markup::SwapCase() const
{
	return Markup{SwapCaseUnicode(text)};
}

Markup
Markup::Strip() const
{
	return Markup{StripWhitespace(text)};
}

Markup
Markup::Strip(const Value &chars) const
{
	return Markup{StripCharacters(text, EscapeOperand(chars))};
}

Markup
Markup::LStrip() const
{
	return Markup{StripWhitespace(text, StripSide::LEFT)};
}

Markup
Markup::LStrip(const Value &chars) const
{
	return Markup{StripCharacters(text, EscapeOperand(chars),
				      StripSide::LEFT)};
}

Markup
Markup::RStrip() const
{
	return Markup{StripWhitespace(text, StripSide::RIGHT)};
}

Markup
Markup::RStrip(const Value &chars) const
{
	return Markup{StripCharacters(text, EscapeOperand(chars),
				      StripSide::RIGHT)};
}

Markup
Markup::Replace(const Value &from, const Value &to,
		std::size_t max_count) const
{
	return Markup{ReplaceAll(text, EscapeOperand(from), EscapeOperand(to),
				 max_count)};
}

Markup
Markup::Center(std::size_t width) const
{
	return Markup{PadString(text, width, " ", PadAlign::CENTER)};
}

Markup
Markup::Center(std::size_t width, const Value &fill) const
{
	return Markup{PadString(text, width, EscapeOperand(fill),
				PadAlign::CENTER)};
}

Markup
Markup::LJust(std::size_t width) const
{
	return Markup{PadString(text, width, " ", PadAlign::LEFT)};
}

Markup
Markup::LJust(std::size_t width, const Value &fill) const
{
	return Markup{PadString(text, width, EscapeOperand(fill),
				PadAlign::LEFT)};
}

Markup
Markup::RJust(std::size_t width) const
{
	return Markup{PadString(text, width, " ", PadAlign::RIGHT)};
}

Markup
Markup::RJust(std::size_t width, const Value &fill) const
{
	return Markup{PadString(text, width, EscapeOperand(fill),
				PadAlign::RIGHT)};
}

Markup
Markup::ZFill(std::size_t width) const
{
	return Markup{ZeroFill(text, width)};
}

Markup
Markup::ExpandTabs(std::size_t tab_size) const
{
	return Markup{::ExpandTabs(text, tab_size)};
}

Markup
Markup::RemovePrefix(const Value &prefix) const
{
	const auto p = EscapeOperand(prefix);
	std::string_view result = text;
	if (result.starts_with(p))
		result.remove_prefix(p.size());
	return Markup{result};
}

Markup
Markup::RemoveSuffix(const Value &suffix) const
{
	const auto s = EscapeOperand(suffix);
	std::string_view result = text;
	if (result.ends_with(s))
		result.remove_suffix(s.size());
	return Markup{result};
}

std::array<Markup, 3>
Markup::Partition(const Value &sep) const
{
	return ToMarkupArray(PartitionString(text, EscapeOperand(sep)));
}

std::array<Markup, 3>
Markup::RPartition(const Value &sep) const
{
	return ToMarkupArray(RPartitionString(text, EscapeOperand(sep)));
}

std::vector<Markup>
Markup::Split(std::size_t max_split) const
{
	return ToMarkupVector(SplitWhitespace(text, max_split));
}

std::vector<Markup>
Markup::Split(const Value &sep, std::size_t max_split) const
{
	return ToMarkupVector(SplitString(text, EscapeOperand(sep), max_split));
}

std::vector<Markup>
Markup::RSplit(std::size_t max_split) const
{
	return ToMarkupVector(RSplitWhitespace(text, max_split));
}

std::vector<Markup>
Markup::RSplit(const Value &sep, std::size_t max_split) const
{
	return ToMarkupVector(RSplitString(text, EscapeOperand(sep), max_split));
}

std::vector<Markup>
Markup::SplitLines(bool keep_ends) const
{
	return ToMarkupVector(::SplitLines(text, keep_ends));
}

Markup
Markup::Join(const ValueList &values) const
{
	std::string result;
	bool first = true;
	for (const auto &i : values) {
		if (!first)
			result += text;
		first = false;
		result += EscapeOperand(i);
	}

	return Markup{std::move(result)};
}

Markup
operator+(const Markup &a, const Markup &b)
{
	return Markup{a.GetText() + b.GetText()};
}

Markup
operator+(const Markup &a, const Value &b)
{
	return Markup{a.GetText() + EscapeOperand(b)};
}

Markup
operator+(const Value &a, const Markup &b)
{
	return Markup{EscapeOperand(a) + b.GetText()};
}

std::ostream &
operator<<(std::ostream &os, const Markup &m)
{
	return os << m.GetText();
}

} // namespace SafeMarkup
