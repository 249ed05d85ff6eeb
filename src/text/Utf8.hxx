// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/**
 * Append the UTF-8 encoding of the given code point.  The caller is
 * responsible for passing a valid Unicode scalar value.
 */
void
AppendUTF8(std::string &dest, char32_t ch);

/**
 * Determine the length of the UTF-8 sequence starting at the given
 * position.  Malformed sequences are treated as single bytes.
 */
[[gnu::pure]]
std::size_t
SequenceLengthUTF8(std::string_view s, std::size_t pos) noexcept;

/**
 * Find the start of the UTF-8 sequence which ends right before the
 * given position.
 */
[[gnu::pure]]
std::size_t
PreviousSequenceUTF8(std::string_view s, std::size_t pos) noexcept;

/**
 * Count the number of characters (code points) in a UTF-8 string.
 */
[[gnu::pure]]
std::size_t
LengthUTF8(std::string_view s) noexcept;
