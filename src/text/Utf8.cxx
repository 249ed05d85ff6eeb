// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Utf8.hxx"

#include <cassert>

void
AppendUTF8(std::string &dest, char32_t ch)
{
	assert(ch <= 0x10ffff);

	if (ch < 0x80) {
		dest.push_back(char(ch));
	} else if (ch < 0x800) {
		dest.push_back(char(0xc0 | (ch >> 6)));
		dest.push_back(char(0x80 | (ch & 0x3f)));
	} else if (ch < 0x10000) {
		dest.push_back(char(0xe0 | (ch >> 12)));
		dest.push_back(char(0x80 | ((ch >> 6) & 0x3f)));
		dest.push_back(char(0x80 | (ch & 0x3f)));
	} else {
		dest.push_back(char(0xf0 | (ch >> 18)));
		dest.push_back(char(0x80 | ((ch >> 12) & 0x3f)));
		dest.push_back(char(0x80 | ((ch >> 6) & 0x3f)));
		dest.push_back(char(0x80 | (ch & 0x3f)));
	}
}

static constexpr bool
IsContinuation(char ch) noexcept
{
	return (static_cast<unsigned char>(ch) & 0xc0) == 0x80;
}

std::size_t
SequenceLengthUTF8(std::string_view s, std::size_t pos) noexcept
{
	assert(pos < s.size());

	const auto ch = static_cast<unsigned char>(s[pos]);
	std::size_t length;
	if (ch < 0xc0)
		return 1;
	else if (ch < 0xe0)
		length = 2;
	else if (ch < 0xf0)
		length = 3;
	else if (ch < 0xf8)
		length = 4;
	else
		return 1;

	if (pos + length > s.size())
		return 1;

	for (std::size_t i = 1; i < length; ++i)
		if (!IsContinuation(s[pos + i]))
			return 1;

	return length;
}

std::size_t
PreviousSequenceUTF8(std::string_view s, std::size_t pos) noexcept
{
	assert(pos > 0);
	assert(pos <= s.size());

	std::size_t start = pos - 1;
	while (start > 0 && pos - start < 4 && IsContinuation(s[start]))
		--start;

	if (start + SequenceLengthUTF8(s, start) == pos)
		return start;

	/* malformed: treat the last byte on its own */
	return pos - 1;
}

std::size_t
LengthUTF8(std::string_view s) noexcept
{
	std::size_t n = 0;
	for (std::size_t i = 0; i < s.size(); i += SequenceLengthUTF8(s, i))
		++n;
	return n;
}
