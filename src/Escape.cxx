// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "safe-markup/Escape.hxx"
#include "Operand.hxx"
#include "escape/HTML.hxx"
#include "escape/String.hxx"

namespace SafeMarkup {

Markup
Escape(const Value &value)
{
	if (value.IsMarkup())
		return value.GetMarkup();

	if (const auto *renderable = value.GetRenderable())
		return renderable->ToMarkup();

	return Markup{escape_string(html_escape_class, value.ToString())};
}

Markup
EscapeSilent(const Value &value)
{
	if (value.IsNull())
		return {};

	return Escape(value);
}

Value
SoftText(const Value &value)
{
	switch (value.GetType()) {
	case Value::Type::STRING:
	case Value::Type::MARKUP:
		return value;

	default:
		break;
	}

	if (const auto *renderable = value.GetRenderable())
		return renderable->ToMarkup();

	return value.ToString();
}

std::string
Unescape(std::string_view text)
{
	return unescape_string(html_escape_class, text);
}

std::string
EscapeOperand(const Value &value)
{
	if (value.IsMarkup())
		return value.GetMarkup().GetText();

	return Escape(value).StealText();
}

Markup
Markup::FromRenderable(const Value &value)
{
	return Escape(value);
}

} // namespace SafeMarkup
