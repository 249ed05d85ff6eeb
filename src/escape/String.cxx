// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "String.hxx"
#include "Class.hxx"

#include <assert.h>

std::string
escape_string(const struct escape_class &cls, std::string_view p)
{
	if (escape_find(&cls, p) == nullptr)
		return std::string{p};

	std::string result;
	result.resize(escape_size(&cls, p));

	size_t out_size = escape_buffer(&cls, p, result.data());
	assert(out_size <= result.size());
	result.resize(out_size);

	return result;
}

std::string
unescape_string(const struct escape_class &cls, std::string_view src)
{
	if (unescape_find(&cls, src) == nullptr)
		return std::string{src};

	std::string result;
	result.reserve(src.size());
	unescape_append(&cls, src, result);
	return result;
}
