// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TextOps.hxx"
#include "CharClass.hxx"
#include "Utf8.hxx"

#include <fmt/format.h>

#include <unicode/ucasemap.h>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

using CaseMapFunction = int32_t (*)(const UCaseMap *csm,
				     char *dest, int32_t dest_capacity,
				     const char *src, int32_t src_length,
				     UErrorCode *error);

static std::string
MapCase(std::string_view s, CaseMapFunction f)
{
	if (s.size() > static_cast<std::size_t>(INT32_MAX))
		throw std::length_error("String too long for case mapping");

	UErrorCode error = U_ZERO_ERROR;
	icu::LocalUCaseMapPointer csm(ucasemap_open("", 0, &error));
	if (U_FAILURE(error))
		throw std::runtime_error(fmt::format("ucasemap_open() failed: {}",
						     u_errorName(error)));

	const auto src_length = static_cast<int32_t>(s.size());

	/* the first pass only determines the length */
	const int32_t length = f(csm.getAlias(), nullptr, 0,
				 s.data(), src_length, &error);
	if (U_FAILURE(error) && error != U_BUFFER_OVERFLOW_ERROR)
		throw std::runtime_error(fmt::format("Case mapping failed: {}",
						     u_errorName(error)));

	std::string result(static_cast<std::size_t>(length), '\0');
	error = U_ZERO_ERROR;
	f(csm.getAlias(), result.data(), length,
	  s.data(), src_length, &error);
	if (U_FAILURE(error))
		throw std::runtime_error(fmt::format("Case mapping failed: {}",
						     u_errorName(error)));

	return result;
}

std::string
UpperUnicode(std::string_view s)
{
	return MapCase(s, ucasemap_utf8ToUpper);
}

std::string
LowerUnicode(std::string_view s)
{
	return MapCase(s, ucasemap_utf8ToLower);
}

/**
 * Pass each code point through the given function and collect the
 * results.  Malformed UTF-8 sequences are copied unchanged.
 */
template<typename F>
static std::string
MapCodePoints(std::string_view s, F &&f)
{
	std::string result;
	result.reserve(s.size());

	for (std::size_t pos = 0; pos < s.size();) {
		const std::size_t length = SequenceLengthUTF8(s, pos);
		const std::string_view sequence = s.substr(pos, length);
		pos += length;

		const auto *bytes = reinterpret_cast<const uint8_t *>(sequence.data());
		const auto sequence_length = static_cast<int32_t>(sequence.size());
		int32_t i = 0;
		UChar32 ch;
		U8_NEXT(bytes, i, sequence_length, ch);
		if (ch < 0 || static_cast<std::size_t>(i) != sequence.size()) {
			result.append(sequence);
			continue;
		}

		AppendUTF8(result, static_cast<char32_t>(f(ch)));
	}

	return result;
}

std::string
SwapCaseUnicode(std::string_view s)
{
	return MapCodePoints(s, [](UChar32 ch){
		if (u_isupper(ch))
			return u_tolower(ch);
		else if (u_islower(ch))
			return u_toupper(ch);
		else
			return ch;
	});
}

std::string
CapitalizeUnicode(std::string_view s)
{
	bool first = true;
	return MapCodePoints(s, [&first](UChar32 ch){
		if (!first)
			return u_tolower(ch);

		first = false;
		return u_totitle(ch);
	});
}

std::string
TitleUnicode(std::string_view s)
{
	bool previous_is_cased = false;
	return MapCodePoints(s, [&previous_is_cased](UChar32 ch){
		const UChar32 result = previous_is_cased
			? u_tolower(ch)
			: u_totitle(ch);
		previous_is_cased = u_hasBinaryProperty(ch, UCHAR_CASED);
		return result;
	});
}

std::string_view
StripWhitespace(std::string_view s, StripSide side) noexcept
{
	if (unsigned(side) & unsigned(StripSide::LEFT))
		while (!s.empty() && IsWhitespaceASCII(s.front()))
			s.remove_prefix(1);

	if (unsigned(side) & unsigned(StripSide::RIGHT))
		while (!s.empty() && IsWhitespaceASCII(s.back()))
			s.remove_suffix(1);

	return s;
}

/**
 * Is the given character (a complete UTF-8 sequence) contained in
 * the set?
 */
[[gnu::pure]]
static bool
SetContains(std::string_view set, std::string_view ch) noexcept
{
	for (std::size_t i = 0; i < set.size();) {
		const std::size_t length = SequenceLengthUTF8(set, i);
		if (set.substr(i, length) == ch)
			return true;
		i += length;
	}

	return false;
}

std::string_view
StripCharacters(std::string_view s, std::string_view chars,
		StripSide side) noexcept
{
	if (unsigned(side) & unsigned(StripSide::LEFT)) {
		while (!s.empty()) {
			const std::size_t length = SequenceLengthUTF8(s, 0);
			if (!SetContains(chars, s.substr(0, length)))
				break;
			s.remove_prefix(length);
		}
	}

	if (unsigned(side) & unsigned(StripSide::RIGHT)) {
		while (!s.empty()) {
			const std::size_t start = PreviousSequenceUTF8(s, s.size());
			if (!SetContains(chars, s.substr(start)))
				break;
			s = s.substr(0, start);
		}
	}

	return s;
}

std::string
ReplaceAll(std::string_view s, std::string_view from, std::string_view to,
	   std::size_t max_count)
{
	std::string result;
	result.reserve(s.size());

	if (from.empty()) {
		/* insert between all characters */
		std::size_t i = 0;
		while (max_count > 0) {
			result.append(to);
			--max_count;

			if (i == s.size())
				break;

			const std::size_t length = SequenceLengthUTF8(s, i);
			result.append(s.substr(i, length));
			i += length;
		}

		if (i < s.size())
			result.append(s.substr(i));
		return result;
	}

	while (max_count > 0) {
		const auto i = s.find(from);
		if (i == s.npos)
			break;

		result.append(s.substr(0, i));
		result.append(to);
		s = s.substr(i + from.size());
		--max_count;
	}

	result.append(s);
	return result;
}

static std::string
RepeatString(std::string_view s, std::size_t n)
{
	std::string result;
	result.reserve(s.size() * n);
	while (n-- > 0)
		result.append(s);
	return result;
}

std::string
PadString(std::string_view s, std::size_t width, std::string_view fill,
	  PadAlign align)
{
	if (fill.empty() || SequenceLengthUTF8(fill, 0) != fill.size())
		throw std::invalid_argument("The fill character must be exactly one character long");

	const std::size_t length = LengthUTF8(s);
	if (length >= width)
		return std::string(s);

	const std::size_t margin = width - length;
	std::size_t left = 0;
	switch (align) {
	case PadAlign::LEFT:
		left = 0;
		break;

	case PadAlign::RIGHT:
		left = margin;
		break;

	case PadAlign::CENTER:
		left = margin / 2 + (margin & width & 1);
		break;
	}

	std::string result = RepeatString(fill, left);
	result.append(s);
	result.append(RepeatString(fill, margin - left));
	return result;
}

std::string
ZeroFill(std::string_view s, std::size_t width)
{
	const std::size_t length = LengthUTF8(s);
	if (length >= width)
		return std::string(s);

	std::string result;
	if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
		result.push_back(s.front());
		s.remove_prefix(1);
	}

	result.append(width - length, '0');
	result.append(s);
	return result;
}

std::string
ExpandTabs(std::string_view s, std::size_t tab_size)
{
	std::string result;
	result.reserve(s.size());

	std::size_t column = 0;
	for (std::size_t i = 0; i < s.size();) {
		const char ch = s[i];
		if (ch == '\t') {
			if (tab_size > 0) {
				const std::size_t n = tab_size - column % tab_size;
				result.append(n, ' ');
				column += n;
			}

			++i;
		} else if (ch == '\n' || ch == '\r') {
			result.push_back(ch);
			column = 0;
			++i;
		} else {
			const std::size_t length = SequenceLengthUTF8(s, i);
			result.append(s.substr(i, length));
			++column;
			i += length;
		}
	}

	return result;
}

static void
CheckSeparator(std::string_view sep)
{
	if (sep.empty())
		throw std::invalid_argument("Empty separator");
}

std::array<std::string_view, 3>
PartitionString(std::string_view s, std::string_view sep)
{
	CheckSeparator(sep);

	const auto i = s.find(sep);
	if (i == s.npos)
		return {s, {}, {}};

	return {s.substr(0, i), s.substr(i, sep.size()),
		s.substr(i + sep.size())};
}

std::array<std::string_view, 3>
RPartitionString(std::string_view s, std::string_view sep)
{
	CheckSeparator(sep);

	const auto i = s.rfind(sep);
	if (i == s.npos)
		return {std::string_view{}, std::string_view{}, s};

	return {s.substr(0, i), s.substr(i, sep.size()),
		s.substr(i + sep.size())};
}

std::vector<std::string_view>
SplitWhitespace(std::string_view s, std::size_t max_split)
{
	std::vector<std::string_view> result;

	while (max_split > 0) {
		s = StripWhitespace(s, StripSide::LEFT);
		if (s.empty())
			return result;

		const auto end = std::find_if(s.begin(), s.end(),
					      IsWhitespaceASCII);
		const std::size_t length = std::distance(s.begin(), end);
		result.push_back(s.substr(0, length));
		s.remove_prefix(length);
		--max_split;
	}

	/* the remainder after the last permitted split */
	s = StripWhitespace(s, StripSide::LEFT);
	if (!s.empty())
		result.push_back(s);

	return result;
}

std::vector<std::string_view>
RSplitWhitespace(std::string_view s, std::size_t max_split)
{
	std::vector<std::string_view> result;

	while (max_split > 0) {
		s = StripWhitespace(s, StripSide::RIGHT);
		if (s.empty())
			break;

		const auto begin = std::find_if(s.rbegin(), s.rend(),
						IsWhitespaceASCII);
		const std::size_t length = std::distance(s.rbegin(), begin);
		result.push_back(s.substr(s.size() - length));
		s.remove_suffix(length);
		--max_split;
	}

	s = StripWhitespace(s, StripSide::RIGHT);
	if (!s.empty())
		result.push_back(s);

	std::reverse(result.begin(), result.end());
	return result;
}

std::vector<std::string_view>
SplitString(std::string_view s, std::string_view sep, std::size_t max_split)
{
	CheckSeparator(sep);

	std::vector<std::string_view> result;

	while (max_split > 0) {
		const auto i = s.find(sep);
		if (i == s.npos)
			break;

		result.push_back(s.substr(0, i));
		s.remove_prefix(i + sep.size());
		--max_split;
	}

	result.push_back(s);
	return result;
}

std::vector<std::string_view>
RSplitString(std::string_view s, std::string_view sep, std::size_t max_split)
{
	CheckSeparator(sep);

	std::vector<std::string_view> result;

	while (max_split > 0) {
		const auto i = s.rfind(sep);
		if (i == s.npos)
			break;

		result.push_back(s.substr(i + sep.size()));
		s = s.substr(0, i);
		--max_split;
	}

	result.push_back(s);
	std::reverse(result.begin(), result.end());
	return result;
}

/**
 * Check for a line boundary at the given position.
 *
 * @return the length of the line boundary sequence or 0
 */
[[gnu::pure]]
static std::size_t
LineBoundaryLength(std::string_view s, std::size_t i) noexcept
{
	switch (s[i]) {
	case '\r':
		return i + 1 < s.size() && s[i + 1] == '\n' ? 2 : 1;

	case '\n':
	case '\v':
	case '\f':
	case '\x1c':
	case '\x1d':
	case '\x1e':
		return 1;

	case '\xc2':
		/* U+0085 NEXT LINE */
		return s.substr(i, 2) == "\xc2\x85" ? 2 : 0;

	case '\xe2':
		/* U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR */
		return s.substr(i, 3) == "\xe2\x80\xa8" ||
			s.substr(i, 3) == "\xe2\x80\xa9"
			? 3
			: 0;

	default:
		return 0;
	}
}

std::vector<std::string_view>
SplitLines(std::string_view s, bool keep_ends)
{
	std::vector<std::string_view> result;

	std::size_t start = 0;
	for (std::size_t i = 0; i < s.size();) {
		const std::size_t boundary = LineBoundaryLength(s, i);
		if (boundary == 0) {
			++i;
			continue;
		}

		const std::size_t end = keep_ends ? i + boundary : i;
		result.push_back(s.substr(start, end - start));
		i += boundary;
		start = i;
	}

	if (start < s.size())
		result.push_back(s.substr(start));

	return result;
}

std::string
CollapseWhitespace(std::string_view s)
{
	std::string result;
	result.reserve(s.size());

	for (const auto word : SplitWhitespace(s)) {
		if (!result.empty())
			result.push_back(' ');
		result.append(word);
	}

	return result;
}
