// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Renderable.hxx"

#include <fmt/format.h>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace SafeMarkup {

using ValueList = std::vector<Value>;
using ValueMap = std::map<std::string, Value, std::less<>>;

/**
 * A string which is safe to be inserted verbatim into HTML/XML
 * element content.  Operations which combine it with other values
 * escape those values first, so the result is safe, too.
 */
class Markup final : public Renderable {
	std::string text;

public:
	Markup() noexcept = default;

	/**
	 * Wrap text which is known to be safe.  It is not checked.
	 */
	explicit Markup(const char *_text)
		:text(_text) {}

	explicit Markup(std::string_view _text)
		:text(_text) {}

	explicit Markup(std::string &&_text) noexcept
		:text(std::move(_text)) {}

	/**
	 * Render the value if it is #Renderable, and escape it
	 * otherwise.
	 */
	static Markup FromRenderable(const Value &value);

	Markup ToMarkup() const override {
		return *this;
	}

	const std::string &GetText() const noexcept {
		return text;
	}

	std::string StealText() && noexcept {
		return std::move(text);
	}

	bool empty() const noexcept {
		return text.empty();
	}

	std::size_t size() const noexcept {
		return text.size();
	}

	bool operator==(const Markup &other) const noexcept {
		return text == other.text;
	}

	bool operator==(std::string_view other) const noexcept {
		return text == other;
	}

	Markup &operator+=(const Markup &other) {
		text += other.text;
		return *this;
	}

	Markup &operator+=(const Value &other);

	/**
	 * Concatenate #n copies.  A count of zero or less yields an
	 * empty #Markup.
	 */
	Markup Repeat(long long n) const;

	/**
	 * printf-style interpolation ("%s", "%(name)d", ...).  A
	 * #ValueList contains the positional arguments, a #ValueMap
	 * supplies the "%(name)" keys; any other value is the only
	 * positional argument.
	 *
	 * Throws #FormatError on error.
	 */
	Markup PercentFormat(const Value &args) const;

	Markup operator%(const Value &args) const {
		return PercentFormat(args);
	}

	/**
	 * Placeholder formatting ("{}", "{0.name}", "{key:>8}").  Named
	 * arguments are passed with Arg().
	 *
	 * Throws #FormatError on error.
	 */
	template<typename... Args>
	Markup Format(Args&&... args) const;

	Markup VFormat(const ValueList &args, const ValueMap &kwargs) const;

	Markup FormatMap(const ValueMap &mapping) const;

	/**
	 * Decode all character references.  The result is plain text.
	 */
	std::string Unescape() const;

	/**
	 * Remove tags and comments, decode character references and
	 * collapse whitespace.  The result is plain text.
	 */
	std::string StripTags() const;

	Markup Upper() const;
	Markup Lower() const;
	Markup Capitalize() const;
	Markup Title() const;
	Markup SwapCase() const;

	Markup Strip() const;
	Markup Strip(const Value &chars) const;
	Markup LStrip() const;
	Markup LStrip(const Value &chars) const;
	Markup RStrip() const;
	Markup RStrip(const Value &chars) const;

	Markup Replace(const Value &from, const Value &to,
		       std::size_t max_count=SIZE_MAX) const;

	Markup Center(std::size_t width) const;
	Markup Center(std::size_t width, const Value &fill) const;
	Markup LJust(std::size_t width) const;
	Markup LJust(std::size_t width, const Value &fill) const;
	Markup RJust(std::size_t width) const;
	Markup RJust(std::size_t width, const Value &fill) const;

	Markup ZFill(std::size_t width) const;
	Markup ExpandTabs(std::size_t tab_size=8) const;

	Markup RemovePrefix(const Value &prefix) const;
	Markup RemoveSuffix(const Value &suffix) const;

	std::array<Markup, 3> Partition(const Value &sep) const;
	std::array<Markup, 3> RPartition(const Value &sep) const;

	/**
	 * Split at runs of whitespace.
	 */
	std::vector<Markup> Split(std::size_t max_split=SIZE_MAX) const;
	std::vector<Markup> Split(const Value &sep,
				  std::size_t max_split=SIZE_MAX) const;
	std::vector<Markup> RSplit(std::size_t max_split=SIZE_MAX) const;
	std::vector<Markup> RSplit(const Value &sep,
				   std::size_t max_split=SIZE_MAX) const;

	std::vector<Markup> SplitLines(bool keep_ends=false) const;

	/**
	 * Concatenate the given values with this string as separator.
	 */
	Markup Join(const ValueList &values) const;
};

/**
 * A dynamically typed operand for escaping and formatting.
 */
class Value {
public:
	enum class Type : uint8_t {
		NONE,
		BOOLEAN,
		INTEGER,
		FLOAT,
		STRING,
		MARKUP,
		LIST,
		MAP,
		RENDERABLE,
		OBJECT,
	};

private:
	std::variant<std::monostate, bool, long long, double, std::string,
		     Markup,
		     std::shared_ptr<const ValueList>,
		     std::shared_ptr<const ValueMap>,
		     std::shared_ptr<const Renderable>,
		     std::shared_ptr<const Object>> value;

	template<typename T>
	static constexpr bool IsHostObject =
		!std::same_as<std::remove_cvref_t<T>, Markup> &&
		!std::same_as<std::remove_cvref_t<T>, Value> &&
		(std::derived_from<std::remove_cvref_t<T>, Object> ||
		 std::derived_from<std::remove_cvref_t<T>, Renderable>);

public:
	Value() noexcept = default;

	Value(std::nullptr_t) noexcept {}

	Value(bool b) noexcept
		:value(b) {}

	template<std::integral T>
	requires(!std::same_as<T, bool>)
	Value(T i) noexcept
		:value(static_cast<long long>(i)) {}

	template<std::floating_point T>
	Value(T d) noexcept
		:value(static_cast<double>(d)) {}

	Value(const char *s)
		:value(std::string{s}) {}

	Value(std::string_view s)
		:value(std::string{s}) {}

	Value(const std::string &s)
		:value(s) {}

	Value(std::string &&s) noexcept
		:value(std::move(s)) {}

	Value(const Markup &m)
		:value(m) {}

	Value(Markup &&m) noexcept
		:value(std::move(m)) {}

	Value(ValueList list)
		:value(std::make_shared<const ValueList>(std::move(list))) {}

	Value(ValueMap map)
		:value(std::make_shared<const ValueMap>(std::move(map))) {}

	/**
	 * Reference a host object.  If it implements both #Object and
	 * #Renderable, it is stored as #Object and its #Renderable
	 * interface is discovered on demand.
	 */
	template<typename T>
	requires(std::derived_from<T, Object> || std::derived_from<T, Renderable>)
	Value(std::shared_ptr<T> object) noexcept {
		if constexpr (std::derived_from<T, Object>)
			value = std::shared_ptr<const Object>(std::move(object));
		else
			value = std::shared_ptr<const Renderable>(std::move(object));
	}

	/**
	 * Copy or move a host object into a new shared instance.
	 */
	template<typename T>
	requires IsHostObject<T>
	Value(T &&object)
		:Value(std::make_shared<std::remove_cvref_t<T>>(std::forward<T>(object))) {}

	Type GetType() const noexcept {
		return static_cast<Type>(value.index());
	}

	bool IsNull() const noexcept {
		return GetType() == Type::NONE;
	}

	bool IsString() const noexcept {
		return GetType() == Type::STRING;
	}

	bool IsMarkup() const noexcept {
		return GetType() == Type::MARKUP;
	}

	bool IsList() const noexcept {
		return GetType() == Type::LIST;
	}

	bool IsMap() const noexcept {
		return GetType() == Type::MAP;
	}

	bool GetBoolean() const {
		return std::get<bool>(value);
	}

	long long GetInteger() const {
		return std::get<long long>(value);
	}

	double GetFloat() const {
		return std::get<double>(value);
	}

	const std::string &GetString() const {
		return std::get<std::string>(value);
	}

	const Markup &GetMarkup() const {
		return std::get<Markup>(value);
	}

	const ValueList &GetList() const {
		return *std::get<std::shared_ptr<const ValueList>>(value);
	}

	const ValueMap &GetMap() const {
		return *std::get<std::shared_ptr<const ValueMap>>(value);
	}

	/**
	 * @return the #Object or nullptr if this is not one
	 */
	[[gnu::pure]]
	const Object *GetObject() const noexcept;

	/**
	 * @return the #Renderable interface (of a #Markup, a
	 * #Renderable or an #Object which implements it) or nullptr
	 */
	[[gnu::pure]]
	const Renderable *GetRenderable() const noexcept;

	[[gnu::pure]]
	const FormatRenderable *GetFormatRenderable() const noexcept;

	/**
	 * Convert to plain (unescaped) text.
	 *
	 * Throws std::invalid_argument if this is null.
	 */
	std::string ToString() const;

	/**
	 * Resolve a ".name" in a format field.
	 *
	 * Throws #FormatError if there is no such attribute.
	 */
	Value GetAttribute(std::string_view name) const;

	/**
	 * Resolve a "[key]" in a format field.  Lists are indexed
	 * with decimal numbers, maps with their string keys.
	 *
	 * Throws #FormatError if there is no such item.
	 */
	Value GetItem(std::string_view key) const;
};

/**
 * A named argument for Markup::Format().
 */
struct NamedArg {
	std::string name;
	Value value;
};

inline NamedArg
Arg(std::string_view name, Value value)
{
	return {std::string{name}, std::move(value)};
}

template<typename... Args>
Markup
Markup::Format(Args&&... args) const
{
	ValueList list;
	ValueMap map;

	auto add = [&list, &map]<typename T>(T &&arg){
		if constexpr (std::same_as<std::remove_cvref_t<T>, NamedArg>)
			map.insert_or_assign(arg.name, arg.value);
		else
			list.emplace_back(std::forward<T>(arg));
	};

	(add(std::forward<Args>(args)), ...);
	return VFormat(list, map);
}

Markup
operator+(const Markup &a, const Markup &b);

Markup
operator+(const Markup &a, const Value &b);

Markup
operator+(const Value &a, const Markup &b);

inline Markup
operator*(const Markup &m, long long n)
{
	return m.Repeat(n);
}

inline Markup
operator*(long long n, const Markup &m)
{
	return m.Repeat(n);
}

std::ostream &
operator<<(std::ostream &os, const Markup &m);

} // namespace SafeMarkup

template<>
struct fmt::formatter<SafeMarkup::Markup> : formatter<std::string_view> {
	template<typename FormatContext>
	auto format(const SafeMarkup::Markup &m, FormatContext &ctx) const {
		return formatter<std::string_view>::format(m.GetText(), ctx);
	}
};
