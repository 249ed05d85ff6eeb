// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Formatter.hxx"
#include "safe-markup/Error.hxx"
#include "escape/HTML.hxx"
#include "escape/String.hxx"
#include "text/CharClass.hxx"

#include <fmt/format.h>

#include <algorithm>

namespace SafeMarkup {

namespace {

class Formatter {
	const ValueList &args;
	const ValueMap &kwargs;

	enum class Numbering {
		UNDECIDED,

		/** "{}" */
		AUTOMATIC,

		/** "{0}" */
		MANUAL,
	} numbering = Numbering::UNDECIDED;

	std::size_t next_index = 0;

public:
	Formatter(const ValueList &_args, const ValueMap &_kwargs) noexcept
		:args(_args), kwargs(_kwargs) {}

	/**
	 * @param depth the number of nesting levels which are still
	 * allowed in format specifications
	 */
	void Format(std::string &dest, std::string_view format,
		    unsigned depth);

private:
	void AppendField(std::string &dest, std::string_view field,
			 unsigned depth);

	const Value &GetPositional(std::size_t index) const;
	Value ResolveField(std::string_view name);
};

} // anonymous namespace

/**
 * Find the end of the field name, i.e. the first ':' or '!' which is
 * not inside brackets.
 */
static std::size_t
FindFieldNameEnd(std::string_view field)
{
	for (std::size_t i = 0; i < field.size(); ++i) {
		switch (field[i]) {
		case '[':
			i = field.find(']', i);
			if (i == field.npos)
				throw FormatError(FormatErrorCode::SYNTAX,
						  "Missing ']' in format string");
			break;

		case ':':
		case '!':
			return i;
		}
	}

	return field.size();
}

[[gnu::pure]]
static bool
IsDecimal(std::string_view s) noexcept
{
	return !s.empty() && std::all_of(s.begin(), s.end(), IsDigitASCII);
}

/**
 * Apply a format specification to a value which is not
 * #Renderable, returning plain text.
 */
static std::string
FormatWithSpec(const Value &value, std::string_view spec)
{
	const std::string f = fmt::format("{{:{}}}", spec);

	try {
		switch (value.GetType()) {
		case Value::Type::BOOLEAN:
			{
				const bool b = value.GetBoolean();
				return fmt::vformat(f, fmt::make_format_args(b));
			}

		case Value::Type::INTEGER:
			{
				const long long i = value.GetInteger();
				return fmt::vformat(f, fmt::make_format_args(i));
			}

		case Value::Type::FLOAT:
			{
				const double d = value.GetFloat();
				return fmt::vformat(f, fmt::make_format_args(d));
			}

		default:
			{
				const std::string s = value.ToString();
				const std::string_view v = s;
				return fmt::vformat(f, fmt::make_format_args(v));
			}
		}
	} catch (const fmt::format_error &e) {
		throw FormatError(FormatErrorCode::SPEC,
				  fmt::format("Invalid format specification '{}': {}",
					      spec, e.what()));
	}
}

/**
 * Render a resolved field value as safe markup text.
 */
static std::string
RenderField(const Value &value, std::string_view spec)
{
	/* FormatMarkup() is only consulted for a non-empty spec; a
	   plain "{}" renders through ToMarkup() like any other
	   Renderable */
	if (const auto *fr = value.GetFormatRenderable();
	    fr != nullptr && !spec.empty())
		return fr->FormatMarkup(spec).StealText();

	if (const auto *renderable = value.GetRenderable()) {
		if (!spec.empty())
			throw FormatError(FormatErrorCode::SPEC,
					  fmt::format("Format specification '{}' given, but the value does not support format specifications",
						      spec));

		return renderable->ToMarkup().StealText();
	}

	const std::string text = spec.empty()
		? value.ToString()
		: FormatWithSpec(value, spec);
	return escape_string(html_escape_class, text);
}

void
Formatter::Format(std::string &dest, std::string_view format, unsigned depth)
{
	std::size_t i = 0;
	while (i < format.size()) {
		const auto brace = format.find_first_of("{}", i);
		if (brace == format.npos) {
			dest.append(format.substr(i));
			break;
		}

		dest.append(format.substr(i, brace - i));
		i = brace;

		if (format[i] == '}') {
			if (i + 1 < format.size() && format[i + 1] == '}') {
				dest.push_back('}');
				i += 2;
				continue;
			}

			throw FormatError(FormatErrorCode::SYNTAX,
					  "Single '}' encountered in format string");
		}

		if (i + 1 < format.size() && format[i + 1] == '{') {
			dest.push_back('{');
			i += 2;
			continue;
		}

		/* find the matching closing brace */
		std::size_t end = i + 1;
		unsigned level = 1;
		for (; end < format.size(); ++end) {
			if (format[end] == '{')
				++level;
			else if (format[end] == '}' && --level == 0)
				break;
		}

		if (end >= format.size())
			throw FormatError(FormatErrorCode::SYNTAX,
					  "Expected '}' before end of string");

		AppendField(dest, format.substr(i + 1, end - i - 1), depth);
		i = end + 1;
	}
}

void
Formatter::AppendField(std::string &dest, std::string_view field,
		       unsigned depth)
{
	if (depth == 0)
		throw FormatError(FormatErrorCode::SYNTAX,
				  "Max string recursion exceeded");

	std::size_t i = FindFieldNameEnd(field);
	const auto name = field.substr(0, i);

	char conversion = 0;
	if (i < field.size() && field[i] == '!') {
		if (i + 1 >= field.size())
			throw FormatError(FormatErrorCode::SYNTAX,
					  "End of string while looking for conversion specifier");

		conversion = field[i + 1];
		i += 2;

		if (i < field.size() && field[i] != ':')
			throw FormatError(FormatErrorCode::SYNTAX,
					  "Expected ':' after conversion specifier");
	}

	std::string_view spec;
	if (i < field.size())
		spec = field.substr(i + 1);

	/* the field is resolved before the nested fields of its
	   specification, which matters for automatic numbering */
	Value value = ResolveField(name);

	switch (conversion) {
	case 0:
		break;

	case 's':
	case 'r':
		value = value.ToString();
		break;

	default:
		throw FormatError(FormatErrorCode::SYNTAX,
				  fmt::format("Unknown conversion specifier {}",
					      conversion));
	}

	std::string expanded_spec;
	if (spec.find('{') != spec.npos) {
		Format(expanded_spec, spec, depth - 1);
		spec = expanded_spec;
	}

	dest += RenderField(value, spec);
}

const Value &
Formatter::GetPositional(std::size_t index) const
{
	if (index >= args.size())
		throw FormatError(FormatErrorCode::MISSING_ARGUMENT,
				  fmt::format("Replacement index {} out of range for positional args",
					      index));

	return args[index];
}

Value
Formatter::ResolveField(std::string_view name)
{
	std::size_t i = std::min(name.find_first_of(".["), name.size());
	const auto first = name.substr(0, i);

	Value value;
	if (first.empty()) {
		if (numbering == Numbering::MANUAL)
			throw FormatError(FormatErrorCode::SYNTAX,
					  "Cannot switch from manual field specification to automatic field numbering");

		numbering = Numbering::AUTOMATIC;
		value = GetPositional(next_index++);
	} else if (IsDecimal(first)) {
		if (numbering == Numbering::AUTOMATIC)
			throw FormatError(FormatErrorCode::SYNTAX,
					  "Cannot switch from automatic field numbering to manual field specification");

		numbering = Numbering::MANUAL;

		std::size_t index = 0;
		for (const char ch : first) {
			index = index * 10 + (ch - '0');
			if (index >= args.size())
				throw FormatError(FormatErrorCode::MISSING_ARGUMENT,
						  fmt::format("Replacement index {} out of range for positional args",
							      first));
		}

		value = GetPositional(index);
	} else {
		auto k = kwargs.find(first);
		if (k == kwargs.end())
			throw FormatError(FormatErrorCode::MISSING_ARGUMENT,
					  fmt::format("No argument named '{}'", first));

		value = k->second;
	}

	while (i < name.size()) {
		if (name[i] == '.') {
			const std::size_t start = ++i;
			i = std::min(name.find_first_of(".[", i), name.size());

			const auto attribute = name.substr(start, i - start);
			if (attribute.empty())
				throw FormatError(FormatErrorCode::SYNTAX,
						  "Empty attribute in format string");

			value = value.GetAttribute(attribute);
		} else {
			const std::size_t start = ++i;
			i = name.find(']', i);
			if (i == name.npos)
				throw FormatError(FormatErrorCode::SYNTAX,
						  "Missing ']' in format string");

			const auto key = name.substr(start, i - start);
			if (key.empty())
				throw FormatError(FormatErrorCode::SYNTAX,
						  "Empty attribute in format string");

			value = value.GetItem(key);

			++i;
			if (i < name.size() && name[i] != '.' && name[i] != '[')
				throw FormatError(FormatErrorCode::SYNTAX,
						  "Only '.' or '[' may follow ']' in format field specifier");
		}
	}

	return value;
}

std::string
FormatFields(std::string_view format,
	     const ValueList &args, const ValueMap &kwargs)
{
	Formatter formatter(args, kwargs);
	std::string result;
	result.reserve(format.size());
	formatter.Format(result, format, 2);
	return result;
}

} // namespace SafeMarkup
