// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SocketConfig.hxx"
#include "UniqueSocketDescriptor.hxx"
#include "LocalSocketAddress.hxx"
#include "SocketError.hxx"
#include "io/ScopeUmask.hxx"
#include "lib/fmt/SocketError.hxx"

#include <cassert>
#include <optional>

#include <unistd.h>

UniqueSocketDescriptor
SocketConfig::Create(int type) const
{
	assert(!bind_path.empty());

	const LocalSocketAddress bind_address{bind_path};

	UniqueSocketDescriptor fd;
	if (!fd.CreateNonBlock(AF_LOCAL, type, 0))
		throw MakeSocketError("Failed to create socket");

	const char *local_path = SocketAddress{bind_address}.GetLocalPath();
	if (local_path != nullptr)
		/* delete non-abstract socket files before reusing them */
		unlink(local_path);

	if (pass_cred)
		/* we want to receive the client's UID */
		fd.SetBoolOption(SOL_SOCKET, SO_PASSCRED, true);

	{
		/* bind() applies the umask to the new socket file */
		std::optional<ScopeUmask> scope_umask;
		if (world_connectable)
			scope_umask.emplace(0);

		if (!fd.Bind(bind_address))
			throw FmtSocketError("Failed to bind to '{}'", bind_path);
	}

	if (listen > 0 && !fd.Listen(listen))
		throw MakeSocketError("Failed to listen");

	return fd;
}
