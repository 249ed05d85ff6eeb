// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Read HTML from stdin and print its text.
 */

#include "ToolCommandLine.hxx"
#include "TagStripper.hxx"
#include "Logger.hxx"

#include <fmt/core.h>

#include <exception>
#include <stdexcept>

#include <stdio.h>
#include <stdlib.h>

static constexpr Logger logger("RunStripTags");

int
main(int argc, char **argv)
try {
	const int first = ParseToolCommandLine(argc, argv);
	if (first != argc)
		throw Usage();

	TagStripper stripper;

	char buffer[4096];
	size_t nbytes;
	while ((nbytes = fread(buffer, 1, sizeof(buffer), stdin)) > 0) {
		logger(3, "read ", nbytes, " bytes");
		stripper.Feed({buffer, nbytes});
	}

	if (ferror(stdin))
		throw std::runtime_error("Failed to read from stdin");

	fmt::print("{}\n", stripper.Finish());
	return EXIT_SUCCESS;
} catch (Usage) {
	fmt::print(stderr, "usage: {} [-v] [-q] <INPUT.html\n", argv[0]);
	return EXIT_FAILURE;
} catch (...) {
	logger(1, std::current_exception());
	return EXIT_FAILURE;
}
