// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string>

class UniqueSocketDescriptor;

/**
 * Configuration for a listener on a local (AF_LOCAL) socket.
 */
struct SocketConfig {
	/**
	 * The socket path.  A leading '@' selects the abstract
	 * namespace.
	 */
	std::string bind_path;

	/**
	 * If non-zero, calls listen().  Value is the backlog.
	 */
	unsigned listen = 0;

	/**
	 * If true, then bind() with an empty umask, making the socket
	 * file connectable by everybody.
	 */
	bool world_connectable = false;

	bool pass_cred = false;

	/**
	 * Create a listening socket.
	 *
	 * Throws exception on error.
	 */
	UniqueSocketDescriptor Create(int type) const;
};
