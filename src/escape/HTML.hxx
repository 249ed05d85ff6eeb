// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

/**
 * Escape the five HTML/XML special characters (with numeric
 * references for the quotes) or unescape all HTML5 character
 * references.
 */
extern const struct escape_class html_escape_class;
