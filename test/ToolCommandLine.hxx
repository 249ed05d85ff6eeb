// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Thrown by ParseToolCommandLine() on a usage error.
 */
struct Usage {};

/**
 * Parse the common options of the developer tools ("-v" more
 * verbose, "-q" quiet) and apply the log level.
 *
 * Throws #Usage on error.
 *
 * @return the index of the first non-option argument
 */
int
ParseToolCommandLine(int argc, char **argv);
