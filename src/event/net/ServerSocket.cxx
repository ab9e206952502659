// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ServerSocket.hxx"
#include "net/SocketConfig.hxx"
#include "net/SocketError.hxx"

#include <cassert>

#include <sys/socket.h>

ServerSocket::~ServerSocket() noexcept
{
	event.Close();
}

void
ServerSocket::Listen(UniqueSocketDescriptor _fd) noexcept
{
	assert(!event.IsDefined());
	assert(_fd.IsDefined());

	event.Open(_fd.Release());
	event.ScheduleRead();
}

void
ServerSocket::Listen(const SocketConfig &config)
{
	Listen(config.Create(SOCK_STREAM));
}

void
ServerSocket::ListenPath(const char *path)
{
	const SocketConfig config{
		.bind_path = path,
		.listen = 256,
		.world_connectable = true,
		.pass_cred = true,
	};

	Listen(config);
}

void
ServerSocket::EventCallback(unsigned) noexcept
{
	UniqueSocketDescriptor remote_fd{AdoptTag{}, GetSocket().AcceptNonBlock()};
	if (!remote_fd.IsDefined()) {
		const auto e = GetSocketError();
		if (!IsSocketErrorAcceptWouldBlock(e))
			OnAcceptError(std::make_exception_ptr(MakeSocketError(e, "Failed to accept connection")));

		return;
	}

	OnAccept(std::move(remote_fd));
}
