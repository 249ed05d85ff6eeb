// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

namespace SafeMarkup {

class Value;

/**
 * Interpolate the arguments into a printf-style template which is
 * already safe.  Text arguments are escaped.
 *
 * Throws #FormatError on error.
 */
std::string
PercentFormat(std::string_view format, const Value &args);

} // namespace SafeMarkup
