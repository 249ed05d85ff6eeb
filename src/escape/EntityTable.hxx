// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string_view>

struct HtmlEntity {
	/**
	 * The reference name without the leading ampersand, including
	 * the trailing semicolon if the reference requires one.
	 */
	std::string_view name;

	/**
	 * The UTF-8 replacement text.
	 */
	std::string_view value;
};

extern const HtmlEntity html_entities[];
extern const std::size_t n_html_entities;
