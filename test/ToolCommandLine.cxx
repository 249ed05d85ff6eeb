// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ToolCommandLine.hxx"
#include "Logger.hxx"

#include <getopt.h>

int
ParseToolCommandLine(int argc, char **argv)
{
	unsigned verbose = 1;

	while (true) {
		int ret = getopt(argc, argv, "vq");
		if (ret == -1)
			break;

		switch (ret) {
		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		default:
			throw Usage();
		}
	}

	SetLogLevel(verbose);
	return optind;
}
