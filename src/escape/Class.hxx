// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>

#include <assert.h>
#include <stddef.h>

struct escape_class {
	/**
	 * Find the first character that must be unescaped.  Returns nullptr
	 * when the string can be used as-is without unescaping.
	 */
	const char *(*unescape_find)(std::string_view p) noexcept;

	/**
	 * Unescape the given string and append the result to the
	 * destination string.
	 */
	void (*unescape)(std::string_view p, std::string &dest);

	/**
	 * Find the first character that must be escaped.  Returns nullptr
	 * when there are no such characters.
	 */
	const char *(*escape_find)(std::string_view p) noexcept;

	/**
	 * Measure the buffer size for escaping the given string.
	 */
	size_t (*escape_size)(std::string_view p) noexcept;

	/**
	 * Escape the given string into the output buffer.  Returns the
	 * number of characters in the output buffer.
	 */
	size_t (*escape)(std::string_view p, char *q) noexcept;
};

[[gnu::pure]]
static inline const char *
unescape_find(const struct escape_class *cls, std::string_view p) noexcept
{
	assert(cls != nullptr);
	assert(cls->unescape_find != nullptr);

	return cls->unescape_find(p);
}

static inline void
unescape_append(const struct escape_class *cls,
		std::string_view p, std::string &dest)
{
	assert(cls != nullptr);
	assert(cls->unescape != nullptr);

	cls->unescape(p, dest);
}

[[gnu::pure]]
static inline const char *
escape_find(const struct escape_class *cls, std::string_view p) noexcept
{
	assert(cls != nullptr);
	assert(cls->escape_find != nullptr);

	return cls->escape_find(p);
}

[[gnu::pure]]
static inline size_t
escape_size(const struct escape_class *cls, std::string_view p) noexcept
{
	assert(cls != nullptr);
	assert(cls->escape_size != nullptr);

	return cls->escape_size(p);
}

static inline size_t
escape_buffer(const struct escape_class *cls, std::string_view p, char *q) noexcept
{
	assert(cls != nullptr);
	assert(cls->escape != nullptr);
	assert(q != nullptr);

	size_t length2 = cls->escape(p, q);
	assert(length2 >= p.size());

	return length2;
}
