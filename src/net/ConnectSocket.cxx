// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConnectSocket.hxx"
#include "UniqueSocketDescriptor.hxx"
#include "LocalSocketAddress.hxx"
#include "SocketError.hxx"
#include "lib/fmt/SocketError.hxx"

#include <algorithm>
#include <thread>

#include <errno.h>
#include <sys/socket.h>

UniqueSocketDescriptor
CreateConnectLocalSocket(std::string_view path)
{
	const LocalSocketAddress address{path};

	UniqueSocketDescriptor fd;
	if (!fd.Create(AF_LOCAL, SOCK_STREAM, 0))
		throw MakeSocketError("Failed to create socket");

	if (!fd.Connect(address))
		throw FmtSocketError("Failed to connect to '{}'", path);

	return fd;
}

/**
 * How long to wait before retrying a connect() which was rejected
 * because the listener backlog is full?
 */
static constexpr std::chrono::milliseconds CONNECT_RETRY_DELAY{10};

UniqueSocketDescriptor
CreateConnectLocalSocketNonBlock(std::string_view path,
				 std::chrono::milliseconds timeout)
{
	const LocalSocketAddress address{path};
	const auto deadline = std::chrono::steady_clock::now() + timeout;

	UniqueSocketDescriptor fd;
	if (!fd.CreateNonBlock(AF_LOCAL, SOCK_STREAM, 0))
		throw MakeSocketError("Failed to create socket");

	while (!fd.Connect(address)) {
		const auto e = GetSocketError();
		if (IsSocketErrorInterruped(e))
			continue;

		const auto now = std::chrono::steady_clock::now();

		if (e == EAGAIN) {
			/* AF_LOCAL does not queue the connect; poll
			   until the listener makes room */
			if (now >= deadline)
				throw FmtSocketError(ETIMEDOUT,
						     "Timeout connecting to '{}'",
						     path);

			std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(CONNECT_RETRY_DELAY,
												deadline - now));
			continue;
		}

		if (e != EINPROGRESS)
			throw FmtSocketError(e, "Failed to connect to '{}'", path);

		const auto remaining =
			std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
		const int ready = fd.WaitWritable(std::max(int(remaining.count()), 0));
		if (ready < 0)
			throw FmtSocketError("Failed to connect to '{}'", path);

		if (ready == 0)
			throw FmtSocketError(ETIMEDOUT,
					     "Timeout connecting to '{}'", path);

		const int error = fd.GetIntOption(SOL_SOCKET, SO_ERROR, 0);
		if (error != 0)
			throw FmtSocketError(error, "Failed to connect to '{}'",
					     path);

		break;
	}

	return fd;
}
