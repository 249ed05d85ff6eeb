// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TagStripper.hxx"
#include "Logger.hxx"
#include "escape/HTML.hxx"
#include "escape/String.hxx"
#include "text/CharClass.hxx"
#include "text/TextOps.hxx"

static constexpr Logger logger("TagStripper");

inline void
TagStripper::Transition(char ch) noexcept
{
	switch (state) {
	case State::NONE:
		break;

	case State::TAG_OPEN:
		if (ch == '!')
			state = State::DECLARATION_OPEN;
		else if (ch == '>')
			EndMarkup();
		else {
			state = State::ELEMENT_TAG;
			Transition(ch);
		}

		break;

	case State::ELEMENT_TAG:
		if (ch == '>')
			EndMarkup();
		else if (ch == '=')
			state = State::BEFORE_ATTR_VALUE;
		break;

	case State::BEFORE_ATTR_VALUE:
		if (ch == '"' || ch == '\'') {
			attr_value_delimiter = ch;
			state = State::ATTR_VALUE;
		} else if (ch == '>')
			EndMarkup();
		else if (!IsWhitespaceASCII(ch))
			/* unquoted value */
			state = State::ELEMENT_TAG;
		break;

	case State::ATTR_VALUE:
		if (ch == attr_value_delimiter)
			state = State::ELEMENT_TAG;
		break;

	case State::DECLARATION_OPEN:
		if (ch == '-')
			state = State::COMMENT_OPEN;
		else if (ch == '>')
			EndMarkup();
		else {
			state = State::DECLARATION;
			Transition(ch);
		}

		break;

	case State::COMMENT_OPEN:
		if (ch == '-') {
			state = State::COMMENT;
			minus_count = 0;
		} else {
			state = State::DECLARATION;
			Transition(ch);
		}

		break;

	case State::COMMENT:
		if (ch == '-')
			++minus_count;
		else if (ch == '>' && minus_count >= 2)
			EndMarkup();
		else
			minus_count = 0;
		break;

	case State::DECLARATION:
		if (ch == '>')
			EndMarkup();
		else if (ch == '"' || ch == '\'') {
			attr_value_delimiter = ch;
			state = State::DECLARATION_VALUE;
		}

		break;

	case State::DECLARATION_VALUE:
		if (ch == attr_value_delimiter)
			state = State::DECLARATION;
		break;
	}
}

void
TagStripper::Feed(std::string_view src)
{
	while (!src.empty()) {
		if (state == State::NONE) {
			/* copy everything up to the next tag */
			const auto lt = src.find('<');
			if (lt == src.npos) {
				output.append(src);
				break;
			}

			output.append(src.substr(0, lt));
			pending.assign(1, '<');
			state = State::TAG_OPEN;
			src.remove_prefix(lt + 1);
			continue;
		}

		const char ch = src.front();
		src.remove_prefix(1);

		pending.push_back(ch);
		Transition(ch);
	}
}

std::string
TagStripper::Finish()
{
	if (state != State::NONE) {
		logger(5, "Unterminated markup at end of input: ", pending);
		output.append(pending);
		EndMarkup();
	}

	return CollapseWhitespace(unescape_string(html_escape_class, output));
}

std::string
StripTags(std::string_view src)
{
	TagStripper stripper;
	stripper.Feed(src);
	return stripper.Finish();
}
