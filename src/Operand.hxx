// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

namespace SafeMarkup {

class Value;

/**
 * Obtain the text of an operand which is about to be combined with
 * #Markup: safe values are rendered, all others are escaped.
 */
std::string
EscapeOperand(const Value &value);

} // namespace SafeMarkup
