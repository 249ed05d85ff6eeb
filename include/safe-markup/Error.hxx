// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <stdexcept>
#include <string>

namespace SafeMarkup {

/**
 * Error codes for #FormatError.
 */
enum class FormatErrorCode {
	/**
	 * The template is malformed (unbalanced braces, incomplete or
	 * unknown directive, mixed field numbering).
	 */
	SYNTAX,

	/**
	 * A positional index or a name refers to an argument which
	 * was not supplied.
	 */
	MISSING_ARGUMENT,

	/**
	 * An index, key or attribute in a field chain could not be
	 * resolved.
	 */
	LOOKUP,

	/**
	 * Not all positional arguments were consumed by the template.
	 */
	UNUSED_ARGUMENTS,

	/**
	 * The argument has the wrong type for the conversion.
	 */
	TYPE,

	/**
	 * The format specification was rejected.
	 */
	SPEC,
};

class FormatError : public std::runtime_error {
	FormatErrorCode code;

public:
	FormatError(FormatErrorCode _code, const char *_msg)
		:std::runtime_error(_msg), code(_code) {}

	FormatError(FormatErrorCode _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	FormatErrorCode GetCode() const noexcept {
		return code;
	}
};

} // namespace SafeMarkup
