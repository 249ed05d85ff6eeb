// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "safe-markup/Error.hxx"

#include <gtest/gtest.h>

/**
 * Invoke the function and return the code of the #FormatError it
 * throws.
 */
template<typename F>
static SafeMarkup::FormatErrorCode
CatchFormatError(F &&f)
{
	try {
		f();
	} catch (const SafeMarkup::FormatError &e) {
		return e.GetCode();
	}

	ADD_FAILURE() << "No FormatError was thrown";
	return {};
}
