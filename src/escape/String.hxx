// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Escaping into a newly allocated std::string.
 */

#pragma once

#include <string>
#include <string_view>

struct escape_class;

std::string
escape_string(const struct escape_class &cls, std::string_view p);

std::string
unescape_string(const struct escape_class &cls, std::string_view src);
