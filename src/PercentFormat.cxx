// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PercentFormat.hxx"
#include "Operand.hxx"
#include "safe-markup/Markup.hxx"
#include "safe-markup/Error.hxx"
#include "escape/HTML.hxx"
#include "escape/String.hxx"
#include "text/CharClass.hxx"
#include "text/TextOps.hxx"
#include "text/Utf8.hxx"

#include <fmt/format.h>

#include <climits>
#include <cmath>
#include <optional>

namespace SafeMarkup {

namespace {

/**
 * One parsed "%" directive.
 */
struct Directive {
	std::string_view key;
	bool has_key = false;

	bool left_adjust = false, zero_pad = false;
	bool sign_plus = false, sign_space = false, alternate = false;

	std::size_t width = 0;
	std::optional<std::size_t> precision;

	char conversion = 0;
};

/**
 * Hands out the arguments to the directives and checks that all of
 * them were consumed.
 */
class PercentArguments {
	const Value &args;

	/**
	 * The positional arguments; nullptr if #args is a single
	 * value.
	 */
	const ValueList *const list;

	const ValueMap *const map;

	std::size_t next = 0;

public:
	explicit PercentArguments(const Value &_args) noexcept
		:args(_args),
		 list(args.IsList() ? &args.GetList() : nullptr),
		 map(args.IsMap() ? &args.GetMap() : nullptr) {}

	const Value &Next() {
		if (list != nullptr) {
			if (next >= list->size())
				throw FormatError(FormatErrorCode::MISSING_ARGUMENT,
						  "Not enough arguments for format string");
			return (*list)[next++];
		}

		if (next > 0)
			throw FormatError(FormatErrorCode::MISSING_ARGUMENT,
					  "Not enough arguments for format string");
		++next;
		return args;
	}

	const Value &Lookup(std::string_view key) const {
		if (map == nullptr)
			throw FormatError(FormatErrorCode::TYPE,
					  "Format requires a mapping");

		auto i = map->find(key);
		if (i == map->end())
			throw FormatError(FormatErrorCode::MISSING_ARGUMENT,
					  fmt::format("Key '{}' not found", key));

		return i->second;
	}

	void CheckAllConsumed() const {
		/* a mapping does not need to be consumed */
		if (map != nullptr)
			return;

		const std::size_t n = list != nullptr ? list->size() : 1;
		if (next < n)
			throw FormatError(FormatErrorCode::UNUSED_ARGUMENTS,
					  "Not all arguments converted during string formatting");
	}
};

} // anonymous namespace

/**
 * The largest width or precision; this is the limit of the fmt
 * library.
 */
static constexpr std::size_t MAX_FIELD_SIZE = INT_MAX;

static std::size_t
ParseDecimal(std::string_view format, std::size_t &i)
{
	std::size_t value = 0;
	while (i < format.size() && IsDigitASCII(format[i])) {
		value = value * 10 + (format[i++] - '0');
		if (value > MAX_FIELD_SIZE)
			throw FormatError(FormatErrorCode::SPEC,
					  "Width or precision too big");
	}

	return value;
}

static std::size_t
StarArgument(PercentArguments &args, Directive &d, bool is_width)
{
	const Value &value = args.Next();
	if (value.GetType() != Value::Type::INTEGER)
		throw FormatError(FormatErrorCode::TYPE, "* wants int");

	long long n = value.GetInteger();
	if (n < 0) {
		if (!is_width)
			return 0;

		/* a negative width means left adjustment */
		d.left_adjust = true;
		n = -n;
	}

	if (static_cast<unsigned long long>(n) > MAX_FIELD_SIZE)
		throw FormatError(FormatErrorCode::SPEC,
				  "Width or precision too big");

	return static_cast<std::size_t>(n);
}

/**
 * Parse the directive after the '%' sign.
 *
 * @param i the position after the '%'; is updated to the position
 * after the directive
 */
static Directive
ParseDirective(std::string_view format, std::size_t &i,
	       PercentArguments &args)
{
	Directive d;

	if (i < format.size() && format[i] == '(') {
		const std::size_t start = ++i;
		unsigned level = 1;
		for (; i < format.size(); ++i) {
			if (format[i] == '(')
				++level;
			else if (format[i] == ')' && --level == 0)
				break;
		}

		if (i >= format.size())
			throw FormatError(FormatErrorCode::SYNTAX,
					  "Incomplete format key");

		d.key = format.substr(start, i - start);
		d.has_key = true;
		++i;
	}

	for (; i < format.size(); ++i) {
		switch (format[i]) {
		case '-':
			d.left_adjust = true;
			continue;

		case '0':
			d.zero_pad = true;
			continue;

		case '+':
			d.sign_plus = true;
			continue;

		case ' ':
			d.sign_space = true;
			continue;

		case '#':
			d.alternate = true;
			continue;
		}

		break;
	}

	if (i < format.size() && format[i] == '*') {
		++i;
		d.width = StarArgument(args, d, true);
	} else
		d.width = ParseDecimal(format, i);

	if (i < format.size() && format[i] == '.') {
		++i;
		if (i < format.size() && format[i] == '*') {
			++i;
			d.precision = StarArgument(args, d, false);
		} else
			d.precision = ParseDecimal(format, i);
	}

	while (i < format.size() &&
	       (format[i] == 'h' || format[i] == 'l' || format[i] == 'L'))
		++i;

	if (i >= format.size())
		throw FormatError(FormatErrorCode::SYNTAX, "Incomplete format");

	d.conversion = format[i++];
	return d;
}

static std::string
Pad(std::string &&s, const Directive &d)
{
	if (LengthUTF8(s) >= d.width)
		return std::move(s);

	return PadString(s, d.width, " ",
			 d.left_adjust ? PadAlign::LEFT : PadAlign::RIGHT);
}

/**
 * Truncate to the given number of characters.
 */
static void
TruncateUTF8(std::string &s, std::size_t n) noexcept
{
	std::size_t pos = 0;
	for (std::size_t i = 0; i < n && pos < s.size(); ++i)
		pos += SequenceLengthUTF8(s, pos);

	if (pos < s.size())
		s.resize(pos);
}

/**
 * Format a text directive ("%s").  The value is escaped first;
 * precision and width apply to the escaped text.
 */
static std::string
FormatText(const Directive &d, const Value &value)
{
	std::string text = EscapeOperand(value);
	if (d.precision)
		TruncateUTF8(text, *d.precision);
	return Pad(std::move(text), d);
}

static std::string
FormatCharacter(const Directive &d, const Value &value)
{
	std::string text;

	switch (value.GetType()) {
	case Value::Type::INTEGER:
		{
			const long long ch = value.GetInteger();
			if (ch < 0 || ch > 0x10ffff ||
			    (ch >= 0xd800 && ch <= 0xdfff))
				throw FormatError(FormatErrorCode::TYPE,
						  "%c arg not in range(0x110000)");
			AppendUTF8(text, static_cast<char32_t>(ch));
		}
		break;

	case Value::Type::STRING:
		text = value.GetString();
		break;

	case Value::Type::MARKUP:
		if (LengthUTF8(value.GetMarkup().GetText()) != 1)
			throw FormatError(FormatErrorCode::TYPE,
					  "%c requires an integer or a single character");

		return Pad(std::string{value.GetMarkup().GetText()}, d);

	default:
		throw FormatError(FormatErrorCode::TYPE,
				  "%c requires an integer or a single character");
	}

	if (LengthUTF8(text) != 1)
		throw FormatError(FormatErrorCode::TYPE,
				  "%c requires an integer or a single character");

	return Pad(escape_string(html_escape_class, text), d);
}

/**
 * Obtain an integer for "%d" and friends.  Floating point values are
 * truncated only if #allow_float is set.
 */
static long long
ToInteger(const Directive &d, const Value &value, bool allow_float)
{
	switch (value.GetType()) {
	case Value::Type::BOOLEAN:
		return value.GetBoolean();

	case Value::Type::INTEGER:
		return value.GetInteger();

	case Value::Type::FLOAT:
		if (allow_float) {
			const double f = value.GetFloat();
			if (!std::isfinite(f))
				throw FormatError(FormatErrorCode::TYPE,
						  "Cannot convert float infinity or NaN to integer");
			/* the range of long long is [-2^63, 2^63) */
			if (f >= 0x1p63 || f < -0x1p63)
				throw FormatError(FormatErrorCode::TYPE,
						  "Float out of integer range");
			return static_cast<long long>(f);
		}

		break;

	default:
		break;
	}

	throw FormatError(FormatErrorCode::TYPE,
			  fmt::format("%{} format: {} is required",
				      d.conversion,
				      allow_float ? "a real number" : "an integer"));
}

static std::string
FormatInteger(const Directive &d, long long value)
{
	const unsigned long long magnitude = value < 0
		? 0ULL - static_cast<unsigned long long>(value)
		: static_cast<unsigned long long>(value);

	std::string digits;
	std::string_view prefix;
	switch (d.conversion) {
	case 'o':
		digits = fmt::format("{:o}", magnitude);
		if (d.alternate)
			prefix = "0o";
		break;

	case 'x':
		digits = fmt::format("{:x}", magnitude);
		if (d.alternate)
			prefix = "0x";
		break;

	case 'X':
		digits = fmt::format("{:X}", magnitude);
		if (d.alternate)
			prefix = "0X";
		break;

	default:
		digits = fmt::format_int(magnitude).str();
		break;
	}

	if (d.precision && digits.size() < *d.precision)
		digits.insert(0, *d.precision - digits.size(), '0');

	std::string result;
	if (value < 0)
		result.push_back('-');
	else if (d.sign_plus)
		result.push_back('+');
	else if (d.sign_space)
		result.push_back(' ');

	result.append(prefix);

	const std::size_t length = result.size() + digits.size();
	if (length < d.width && d.zero_pad && !d.left_adjust)
		result.append(d.width - length, '0');

	result.append(digits);
	return Pad(std::move(result), d);
}

static std::string
FormatFloat(const Directive &d, const Value &value)
{
	double f;
	switch (value.GetType()) {
	case Value::Type::BOOLEAN:
		f = value.GetBoolean();
		break;

	case Value::Type::INTEGER:
		f = static_cast<double>(value.GetInteger());
		break;

	case Value::Type::FLOAT:
		f = value.GetFloat();
		break;

	default:
		throw FormatError(FormatErrorCode::TYPE,
				  fmt::format("%{} format: a real number is required",
					      d.conversion));
	}

	std::string spec = "{:";
	if (d.left_adjust)
		spec.push_back('<');
	if (d.sign_plus)
		spec.push_back('+');
	else if (d.sign_space)
		spec.push_back(' ');
	if (d.alternate)
		spec.push_back('#');
	if (d.zero_pad && !d.left_adjust)
		spec.push_back('0');
	if (d.width > 0)
		spec += fmt::format_int(d.width).c_str();
	spec.push_back('.');
	spec += fmt::format_int(d.precision.value_or(6)).c_str();
	spec.push_back(d.conversion);
	spec.push_back('}');

	try {
		return fmt::vformat(spec, fmt::make_format_args(f));
	} catch (const fmt::format_error &e) {
		throw FormatError(FormatErrorCode::SPEC,
				  fmt::format("Invalid %{} format: {}",
					      d.conversion, e.what()));
	}
}

static std::string
FormatDirective(const Directive &d, const Value &value)
{
	switch (d.conversion) {
	case 's':
	case 'r':
	case 'a':
		return FormatText(d, value);

	case 'c':
		return FormatCharacter(d, value);

	case 'd':
	case 'i':
	case 'u':
		return FormatInteger(d, ToInteger(d, value, true));

	case 'o':
	case 'x':
	case 'X':
		return FormatInteger(d, ToInteger(d, value, false));

	case 'e':
	case 'E':
	case 'f':
	case 'F':
	case 'g':
	case 'G':
		return FormatFloat(d, value);
	}

	throw FormatError(FormatErrorCode::SYNTAX,
			  fmt::format("Unsupported format character '{}' (0x{:x})",
				      d.conversion,
				      static_cast<unsigned char>(d.conversion)));
}

std::string
PercentFormat(std::string_view format, const Value &args)
{
	PercentArguments arguments(args);
	std::string result;
	result.reserve(format.size());

	std::size_t i = 0;
	while (i < format.size()) {
		const auto percent = format.find('%', i);
		if (percent == format.npos) {
			result.append(format.substr(i));
			break;
		}

		result.append(format.substr(i, percent - i));
		i = percent + 1;

		if (i < format.size() && format[i] == '%') {
			result.push_back('%');
			++i;
			continue;
		}

		const Directive d = ParseDirective(format, i, arguments);
		if (d.conversion == '%') {
			result.push_back('%');
			continue;
		}

		const Value &value = d.has_key
			? arguments.Lookup(d.key)
			: arguments.Next();

		result += FormatDirective(d, value);
	}

	arguments.CheckAllConsumed();
	return result;
}

} // namespace SafeMarkup
