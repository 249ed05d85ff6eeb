// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

/**
 * Removes tags, comments and declarations from HTML, leaving only
 * the text.  The input may be fed in chunks.
 */
class TagStripper {
	enum class State {
		/** outside of markup; characters are copied */
		NONE,

		/** found '<' */
		TAG_OPEN,

		/** inside the element tag */
		ELEMENT_TAG,

		/** after the '=', waiting for the attribute value */
		BEFORE_ATTR_VALUE,

		/** parsing the quoted attribute value */
		ATTR_VALUE,

		/** found "<!" */
		DECLARATION_OPEN,

		/** found "<!-" */
		COMMENT_OPEN,

		/** within a comment; only "-->" ends it */
		COMMENT,

		/** within a declaration such as "<!DOCTYPE html>" */
		DECLARATION,

		/** parsing a quoted string inside a declaration */
		DECLARATION_VALUE,
	} state = State::NONE;

	char attr_value_delimiter = 0;

	/** in a comment, how many consecutive minus are there? */
	unsigned minus_count = 0;

	/**
	 * The raw text of the markup which is currently being parsed,
	 * starting with the '<'.
	 */
	std::string pending;

	std::string output;

public:
	void Feed(std::string_view src);

	bool IsInsideMarkup() const noexcept {
		return state != State::NONE;
	}

	/**
	 * Finish parsing.  Markup which is still open is kept as
	 * literal text.
	 *
	 * @return the text with character references decoded and
	 * whitespace collapsed
	 */
	std::string Finish();

private:
	void EndMarkup() noexcept {
		state = State::NONE;
		pending.clear();
	}

	void Transition(char ch) noexcept;
};

/**
 * Convert HTML to plain text: remove all markup, decode character
 * references and collapse whitespace.
 */
std::string
StripTags(std::string_view src);
