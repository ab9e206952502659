// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CommandLine.hxx"
#include "../Config.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <fmt/core.h>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

namespace Broker {

static void
PrintUsage(const char *program) noexcept
{
	fmt::print("usage: {} [OPTIONS]\n"
		   "\n"
		   "  --config=PATH  load this configuration file (default: {})\n"
		   "  -v, --verbose  log more (may be repeated)\n"
		   "  -q, --quiet    log nothing but errors\n"
		   "  -h, --help     show this help\n",
		   program, DEFAULT_CONFIG_PATH);
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	enum {
		OPTION_CONFIG = 0x100,
	};

	static constexpr struct option long_options[] = {
		{"config", required_argument, nullptr, OPTION_CONFIG},
		{"verbose", no_argument, nullptr, 'v'},
		{"quiet", no_argument, nullptr, 'q'},
		{"help", no_argument, nullptr, 'h'},
		{nullptr, 0, nullptr, 0},
	};

	CommandLine cmdline;
	cmdline.config_path = DEFAULT_CONFIG_PATH;

	opterr = 0;
	optind = 1;

	int option;
	while ((option = getopt_long(argc, argv, "+vqh",
				     long_options, nullptr)) >= 0) {
		switch (option) {
		case OPTION_CONFIG:
			cmdline.config_path = optarg;
			break;

		case 'v':
			++cmdline.verbose;
			break;

		case 'q':
			cmdline.verbose = 1;
			break;

		case 'h':
			PrintUsage(argv[0]);
			exit(EXIT_SUCCESS);

		default:
			if (optopt != 0)
				throw FmtRuntimeError("Unknown option: -{}",
						      char(optopt));
			else
				throw FmtRuntimeError("Unknown option: {}",
						      argv[optind - 1]);
		}
	}

	if (optind < argc)
		throw FmtRuntimeError("Unexpected argument: {}", argv[optind]);

	return cmdline;
}

} // namespace Broker
