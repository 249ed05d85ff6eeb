// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "HTML.hxx"
#include "Class.hxx"
#include "EntityTable.hxx"
#include "text/CharClass.hxx"
#include "text/Utf8.hxx"

#include <algorithm>
#include <cstdint>

#include <assert.h>
#include <string.h>

/**
 * The longest reference name which is looked up (without the
 * semicolon).
 */
static constexpr size_t MAX_ENTITY_NAME = 32;

static constexpr char32_t REPLACEMENT_CHARACTER = 0xfffd;

/**
 * Replacements for the numeric references 0x80..0x9f, which browsers
 * interpret as windows-1252.
 */
static constexpr char32_t windows1252_c1[] = {
	0x20ac, 0x0081, 0x201a, 0x0192, 0x201e, 0x2026, 0x2020, 0x2021,
	0x02c6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008d, 0x017d, 0x008f,
	0x0090, 0x2018, 0x2019, 0x201c, 0x201d, 0x2022, 0x2013, 0x2014,
	0x02dc, 0x2122, 0x0161, 0x203a, 0x0153, 0x009d, 0x017e, 0x0178,
};

[[gnu::pure]]
static const char *
html_unescape_find(std::string_view p) noexcept
{
	const auto i = p.find('&');
	return i != p.npos
		? p.data() + i
		: nullptr;
}

[[gnu::pure]]
static const HtmlEntity *
FindEntity(std::string_view name) noexcept
{
	const auto end = html_entities + n_html_entities;
	const auto i = std::lower_bound(html_entities, end, name,
					[](const HtmlEntity &e, std::string_view n){
						return e.name < n;
					});
	return i != end && i->name == name
		? i
		: nullptr;
}

/**
 * Code points which are dropped from the output when referenced
 * numerically: C0/C1 controls (except whitespace) and the Unicode
 * noncharacters.
 */
static constexpr bool
IsDroppedCodePoint(uint_least32_t ch) noexcept
{
	return (ch >= 0x01 && ch <= 0x08) || ch == 0x0b ||
		(ch >= 0x0e && ch <= 0x1f) || (ch >= 0x7f && ch <= 0x9f) ||
		(ch >= 0xfdd0 && ch <= 0xfdef) || (ch & 0xfffe) == 0xfffe;
}

static void
AppendCharacterReference(std::string &dest, uint_least32_t value)
{
	if (value == 0)
		AppendUTF8(dest, REPLACEMENT_CHARACTER);
	else if (value == 0x0d)
		dest.push_back('\r');
	else if (value >= 0x80 && value <= 0x9f)
		AppendUTF8(dest, windows1252_c1[value - 0x80]);
	else if ((value >= 0xd800 && value <= 0xdfff) || value > 0x10ffff)
		AppendUTF8(dest, REPLACEMENT_CHARACTER);
	else if (!IsDroppedCodePoint(value))
		AppendUTF8(dest, value);
}

/**
 * Decode a numeric character reference.
 *
 * @param s the input after the ampersand, beginning with '#'
 * @return the number of characters consumed or 0 if this is not a
 * valid reference
 */
static size_t
UnescapeNumeric(std::string_view s, std::string &dest)
{
	assert(!s.empty());
	assert(s.front() == '#');

	size_t i = 1;
	bool hex = false;
	if (i < s.size() && (s[i] == 'x' || s[i] == 'X')) {
		hex = true;
		++i;
	}

	const size_t digits_start = i;
	uint_least32_t value = 0;
	for (; i < s.size(); ++i) {
		const int digit = hex
			? ParseHexDigitASCII(s[i])
			: (IsDigitASCII(s[i]) ? s[i] - '0' : -1);
		if (digit < 0)
			break;

		/* saturate; everything above 0x10ffff is replaced
		   anyway */
		if (value <= 0x10ffff)
			value = value * (hex ? 0x10 : 10) + digit;
	}

	if (i == digits_start)
		return 0;

	/* the semicolon is optional */
	if (i < s.size() && s[i] == ';')
		++i;

	AppendCharacterReference(dest, value);
	return i;
}

static constexpr bool
IsEntityNameChar(char ch) noexcept
{
	return ch != '\t' && ch != '\n' && ch != '\f' && ch != ' ' &&
		ch != '<' && ch != '&' && ch != '#' && ch != ';';
}

/**
 * Decode a named character reference.  If the name is unknown, the
 * longest prefix which is a legacy reference (one which does not
 * require a semicolon) is decoded.
 *
 * @param s the input after the ampersand
 * @return the number of characters consumed or 0 if nothing matched
 */
static size_t
UnescapeNamed(std::string_view s, std::string &dest)
{
	size_t length = 0;
	while (length < s.size() && length < MAX_ENTITY_NAME &&
	       IsEntityNameChar(s[length]))
		++length;

	if (length == 0)
		return 0;

	if (length < s.size() && s[length] == ';')
		++length;

	const auto name = s.substr(0, length);
	if (const auto *entity = FindEntity(name)) {
		dest.append(entity->value);
		return length;
	}

	for (size_t prefix = length - 1; prefix >= 2; --prefix) {
		if (const auto *entity = FindEntity(name.substr(0, prefix))) {
			dest.append(entity->value);
			dest.append(name.substr(prefix));
			return length;
		}
	}

	return 0;
}

static void
html_unescape(std::string_view src, std::string &dest)
{
	while (true) {
		const auto ampersand = src.find('&');
		if (ampersand == src.npos) {
			dest.append(src);
			break;
		}

		dest.append(src.substr(0, ampersand));
		src = src.substr(ampersand + 1);

		const size_t consumed = !src.empty() && src.front() == '#'
			? UnescapeNumeric(src, dest)
			: UnescapeNamed(src, dest);
		if (consumed == 0) {
			/* not a reference: keep the ampersand and
			   continue right after it */
			dest.push_back('&');
			continue;
		}

		src = src.substr(consumed);
	}
}

static size_t
html_escape_size(std::string_view _p) noexcept
{
	const char *p = _p.begin(), *const end = _p.end();

	size_t size = 0;
	while (p < end) {
		switch (*p++) {
		case '&':
		case '"':
		case '\'':
			size += 5;
			break;

		case '<':
		case '>':
			size += 4;
			break;

		default:
			++size;
		}
	}

	return size;
}

static const char *
html_escape_find(std::string_view _p) noexcept
{
	const char *p = _p.begin(), *const end = _p.end();

	while (p < end) {
		switch (*p) {
		case '&':
		case '"':
		case '\'':
		case '<':
		case '>':
			return p;

		default:
			++p;
		}
	}

	return nullptr;
}

static size_t
html_escape(std::string_view _p, char *q) noexcept
{
	const char *p = _p.begin(), *const p_end = _p.end(), *const q_start = q;

	while (p < p_end) {
		char ch = *p++;
		switch (ch) {
		case '&':
			q = (char *)mempcpy(q, "&amp;", 5);
			break;

		case '"':
			q = (char *)mempcpy(q, "&#34;", 5);
			break;

		case '\'':
			q = (char *)mempcpy(q, "&#39;", 5);
			break;

		case '<':
			q = (char *)mempcpy(q, "&lt;", 4);
			break;

		case '>':
			q = (char *)mempcpy(q, "&gt;", 4);
			break;

		default:
			*q++ = ch;
		}
	}

	return q - q_start;
}

const struct escape_class html_escape_class = {
	html_unescape_find,
	html_unescape,
	html_escape_find,
	html_escape_size,
	html_escape,
};
