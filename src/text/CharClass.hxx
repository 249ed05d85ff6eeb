// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/*
 * Locale-independent ASCII character classification.  Bytes above
 * 0x7f (UTF-8 sequences) are never whitespace or digits.
 */

constexpr bool
IsWhitespaceASCII(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' ||
		ch == '\f' || ch == '\v';
}

constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

/**
 * @return the value of the hexadecimal digit or -1 if the character
 * is not a hexadecimal digit
 */
constexpr int
ParseHexDigitASCII(char ch) noexcept
{
	if (ch >= '0' && ch <= '9')
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}
