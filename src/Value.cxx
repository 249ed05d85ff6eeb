// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "safe-markup/Markup.hxx"
#include "safe-markup/Error.hxx"
#include "text/CharClass.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace SafeMarkup {

Value
Object::GetAttribute(std::string_view name) const
{
	throw FormatError(FormatErrorCode::LOOKUP,
			  fmt::format("Object has no attribute '{}'", name));
}

Value
Object::GetItem(std::string_view key) const
{
	throw FormatError(FormatErrorCode::LOOKUP,
			  fmt::format("Object is not subscriptable (key '{}')",
				      key));
}

const Object *
Value::GetObject() const noexcept
{
	if (const auto *p = std::get_if<std::shared_ptr<const Object>>(&value))
		return p->get();

	return nullptr;
}

const Renderable *
Value::GetRenderable() const noexcept
{
	switch (GetType()) {
	case Type::MARKUP:
		return std::get_if<Markup>(&value);

	case Type::RENDERABLE:
		return std::get<std::shared_ptr<const Renderable>>(value).get();

	case Type::OBJECT:
		return dynamic_cast<const Renderable *>(GetObject());

	default:
		return nullptr;
	}
}

const FormatRenderable *
Value::GetFormatRenderable() const noexcept
{
	switch (GetType()) {
	case Type::RENDERABLE:
		return dynamic_cast<const FormatRenderable *>(GetRenderable());

	case Type::OBJECT:
		return dynamic_cast<const FormatRenderable *>(GetObject());

	default:
		return nullptr;
	}
}

static void
AppendQuoted(std::string &dest, std::string_view s)
{
	dest.push_back('"');
	dest.append(s);
	dest.push_back('"');
}

static void
AppendRepresentation(std::string &dest, const Value &value)
{
	switch (value.GetType()) {
	case Value::Type::NONE:
		dest += "null";
		break;

	case Value::Type::STRING:
		AppendQuoted(dest, value.GetString());
		break;

	case Value::Type::MARKUP:
		AppendQuoted(dest, value.GetMarkup().GetText());
		break;

	default:
		dest += value.ToString();
		break;
	}
}

std::string
Value::ToString() const
{
	switch (GetType()) {
	case Type::NONE:
		throw std::invalid_argument("Null value has no textual representation");

	case Type::BOOLEAN:
		return GetBoolean() ? "true" : "false";

	case Type::INTEGER:
		return fmt::format_int(GetInteger()).str();

	case Type::FLOAT:
		return fmt::format("{}", GetFloat());

	case Type::STRING:
		return GetString();

	case Type::MARKUP:
		return GetMarkup().GetText();

	case Type::LIST:
		{
			std::string result = "[";
			bool first = true;
			for (const auto &i : GetList()) {
				if (!first)
					result += ", ";
				first = false;
				AppendRepresentation(result, i);
			}

			result.push_back(']');
			return result;
		}

	case Type::MAP:
		{
			std::string result = "{";
			bool first = true;
			for (const auto &[key, i] : GetMap()) {
				if (!first)
					result += ", ";
				first = false;
				AppendQuoted(result, key);
				result += ": ";
				AppendRepresentation(result, i);
			}

			result.push_back('}');
			return result;
		}

	case Type::RENDERABLE:
		return std::get<std::shared_ptr<const Renderable>>(value)->ToMarkup().StealText();

	case Type::OBJECT:
		return GetObject()->ToString();
	}

	/* unreachable */
	return {};
}

Value
Value::GetAttribute(std::string_view name) const
{
	if (const auto *object = GetObject())
		return object->GetAttribute(name);

	throw FormatError(FormatErrorCode::LOOKUP,
			  fmt::format("Value has no attribute '{}'", name));
}

[[gnu::pure]]
static bool
IsDecimalIndex(std::string_view s) noexcept
{
	return !s.empty() && std::all_of(s.begin(), s.end(), IsDigitASCII);
}

Value
Value::GetItem(std::string_view key) const
{
	switch (GetType()) {
	case Type::LIST:
		{
			if (!IsDecimalIndex(key))
				throw FormatError(FormatErrorCode::LOOKUP,
						  fmt::format("List indices must be integers, not '{}'",
							      key));

			const auto &list = GetList();
			std::size_t index = 0;
			for (const char ch : key) {
				index = index * 10 + (ch - '0');
				if (index >= list.size())
					throw FormatError(FormatErrorCode::LOOKUP,
							  fmt::format("List index {} out of range",
								      key));
			}

			return list[index];
		}

	case Type::MAP:
		{
			const auto &map = GetMap();
			if (auto i = map.find(key); i != map.end())
				return i->second;

			throw FormatError(FormatErrorCode::LOOKUP,
					  fmt::format("Key '{}' not found", key));
		}

	case Type::OBJECT:
		return GetObject()->GetItem(key);

	default:
		throw FormatError(FormatErrorCode::LOOKUP,
				  fmt::format("Value is not subscriptable (key '{}')",
					      key));
	}
}

} // namespace SafeMarkup
