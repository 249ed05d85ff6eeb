// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Markup.hxx"

#include <string>
#include <string_view>

namespace SafeMarkup {

/**
 * Escape the characters '&', '<', '>', '"' and "'" for HTML.  Values
 * which are #Renderable (including #Markup) are rendered and returned
 * without further escaping; all other values are converted to text
 * first.
 *
 * Throws std::invalid_argument if the value is null.
 */
Markup
Escape(const Value &value);

/**
 * Like Escape(), but a null value results in an empty #Markup.
 */
Markup
EscapeSilent(const Value &value);

/**
 * Convert a value to text without escaping it.  Strings and #Markup
 * are returned as they are, #Renderable values as #Markup.
 *
 * Throws std::invalid_argument if the value is null.
 */
Value
SoftText(const Value &value);

/**
 * Decode all HTML character references (named, decimal and
 * hexadecimal).
 */
std::string
Unescape(std::string_view text);

} // namespace SafeMarkup
