// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ToolCommandLine.hxx"
#include "Logger.hxx"
#include "safe-markup/Escape.hxx"

#include <fmt/core.h>

#include <exception>

#include <stdlib.h>

static constexpr Logger logger("RunHtmlUnescape");

int
main(int argc, char **argv)
try {
	const int first = ParseToolCommandLine(argc, argv);
	if (first >= argc)
		throw Usage();

	for (int i = first; i < argc; ++i)
		fmt::print("{}\n", SafeMarkup::Unescape(argv[i]));

	return EXIT_SUCCESS;
} catch (Usage) {
	fmt::print(stderr, "usage: {} [-v] [-q] MARKUP...\n", argv[0]);
	return EXIT_FAILURE;
} catch (...) {
	logger(1, std::current_exception());
	return EXIT_FAILURE;
}
