// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/*
 * Operations on UTF-8 text which std::string does not provide.
 * Widths and character sets are measured in code points; whitespace
 * is ASCII only.
 */

enum class StripSide {
	LEFT = 0x1,
	RIGHT = 0x2,
	BOTH = LEFT|RIGHT,
};

enum class PadAlign {
	LEFT,
	RIGHT,
	CENTER,
};

constexpr std::size_t UNLIMITED_SPLIT = std::string_view::npos;

/**
 * Convert to upper case with the full Unicode case mapping (so "ß"
 * becomes "SS").  Malformed UTF-8 sequences are copied unchanged.
 */
std::string
UpperUnicode(std::string_view s);

std::string
LowerUnicode(std::string_view s);

std::string
SwapCaseUnicode(std::string_view s);

/**
 * Convert the first character to title case and all others to lower
 * case.
 */
std::string
CapitalizeUnicode(std::string_view s);

/**
 * Convert the first letter of each word to title case and all others
 * to lower case.  A word begins after any character which is not
 * cased.
 */
std::string
TitleUnicode(std::string_view s);

[[gnu::pure]]
std::string_view
StripWhitespace(std::string_view s, StripSide side=StripSide::BOTH) noexcept;

/**
 * Remove all leading and/or trailing characters contained in the
 * given set.
 */
[[gnu::pure]]
std::string_view
StripCharacters(std::string_view s, std::string_view chars,
		StripSide side=StripSide::BOTH) noexcept;

/**
 * Replace occurrences of #from with #to, at most #max_count times.
 * An empty #from matches between all characters.
 */
std::string
ReplaceAll(std::string_view s, std::string_view from, std::string_view to,
	   std::size_t max_count=UNLIMITED_SPLIT);

/**
 * Pad the string to the given width (in characters).
 *
 * Throws std::invalid_argument if #fill is not exactly one character.
 */
std::string
PadString(std::string_view s, std::size_t width, std::string_view fill,
	  PadAlign align);

/**
 * Pad a numeric string with zeroes on the left, after the sign.
 */
std::string
ZeroFill(std::string_view s, std::size_t width);

std::string
ExpandTabs(std::string_view s, std::size_t tab_size=8);

/**
 * Split at the first occurrence of the separator.  If it is not
 * found, the result is the string and two empty strings.
 *
 * Throws std::invalid_argument if #sep is empty.
 */
std::array<std::string_view, 3>
PartitionString(std::string_view s, std::string_view sep);

/**
 * Split at the last occurrence of the separator.  If it is not found,
 * the result is two empty strings and the string.
 *
 * Throws std::invalid_argument if #sep is empty.
 */
std::array<std::string_view, 3>
RPartitionString(std::string_view s, std::string_view sep);

/**
 * Split at runs of whitespace, ignoring leading and trailing
 * whitespace.
 */
std::vector<std::string_view>
SplitWhitespace(std::string_view s, std::size_t max_split=UNLIMITED_SPLIT);

std::vector<std::string_view>
RSplitWhitespace(std::string_view s, std::size_t max_split=UNLIMITED_SPLIT);

/**
 * Throws std::invalid_argument if #sep is empty.
 */
std::vector<std::string_view>
SplitString(std::string_view s, std::string_view sep,
	    std::size_t max_split=UNLIMITED_SPLIT);

/**
 * Throws std::invalid_argument if #sep is empty.
 */
std::vector<std::string_view>
RSplitString(std::string_view s, std::string_view sep,
	     std::size_t max_split=UNLIMITED_SPLIT);

/**
 * Split at line boundaries ("\n", "\r", "\r\n", "\v", "\f", the
 * ASCII separators 0x1c..0x1e, U+0085, U+2028 and U+2029).
 */
std::vector<std::string_view>
SplitLines(std::string_view s, bool keep_ends=false);

/**
 * Collapse all runs of whitespace to a single space and remove
 * leading and trailing whitespace.
 */
std::string
CollapseWhitespace(std::string_view s);
