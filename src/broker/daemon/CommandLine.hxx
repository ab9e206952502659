// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <filesystem>

namespace Broker {

struct CommandLine {
	std::filesystem::path config_path;

	/**
	 * The log level passed to SetLogLevel().
	 */
	unsigned verbose = 2;
};

/**
 * Parse the command line of one of the broker-relay daemons.  On
 * "--help", print usage and exit.
 *
 * Throws on error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);

} // namespace Broker
