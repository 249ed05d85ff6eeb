// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "safe-markup/Markup.hxx"

#include <string>
#include <string_view>

namespace SafeMarkup {

/**
 * Substitute the "{...}" fields of a template which is already safe.
 * Values which are not #Renderable are escaped.
 *
 * Throws #FormatError on error.
 */
std::string
FormatFields(std::string_view format,
	     const ValueList &args, const ValueMap &kwargs);

} // namespace SafeMarkup
