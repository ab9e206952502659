// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SocketDescriptor.hxx"
#include "SocketAddress.hxx"
#include "PeerCredentials.hxx"

#include <sys/socket.h>

bool
SocketDescriptor::Create(int domain, int type, int protocol) noexcept
{
	type |= SOCK_CLOEXEC;

	int new_fd = socket(domain, type, protocol);
	if (new_fd < 0)
		return false;

	Set(new_fd);
	return true;
}

bool
SocketDescriptor::CreateNonBlock(int domain, int type, int protocol) noexcept
{
	return Create(domain, type | SOCK_NONBLOCK, protocol);
}

int
SocketDescriptor::GetIntOption(int level, int name, int fallback) const noexcept
{
	int value = fallback;
	socklen_t size_r = sizeof(value);
	return getsockopt(fd, level, name, &value, &size_r) == 0
		? value
		: fallback;
}

SocketPeerCredentials
SocketDescriptor::GetPeerCredentials() const noexcept
{
	SocketPeerCredentials result;
	socklen_t len = sizeof(result.cred);
	if (getsockopt(fd, SOL_SOCKET, SO_PEERCRED,
		       &result.cred, &len) < 0 ||
	    len != sizeof(result.cred))
		return SocketPeerCredentials::Undefined();

	return result;
}

bool
SocketDescriptor::SetOption(int level, int name,
			    const void *value, std::size_t size) const noexcept
{
	return setsockopt(fd, level, name, value, size) == 0;
}

bool
SocketDescriptor::Bind(SocketAddress address) const noexcept
{
	return bind(Get(), address.GetAddress(), address.GetSize()) == 0;
}

bool
SocketDescriptor::Listen(int backlog) const noexcept
{
	return listen(Get(), backlog) == 0;
}

SocketDescriptor
SocketDescriptor::AcceptNonBlock() const noexcept
{
	int connection_fd = ::accept4(Get(), nullptr, nullptr,
				      SOCK_CLOEXEC|SOCK_NONBLOCK);
	return SocketDescriptor(connection_fd);
}

bool
SocketDescriptor::Connect(SocketAddress address) const noexcept
{
	return ::connect(Get(), address.GetAddress(), address.GetSize()) >= 0;
}

ssize_t
SocketDescriptor::Receive(std::span<std::byte> dest, int flags) const noexcept
{
	return ::recv(Get(), dest.data(), dest.size(), flags);
}

ssize_t
SocketDescriptor::Send(std::span<const std::byte> src, int flags) const noexcept
{
	flags |= MSG_NOSIGNAL;

	return ::send(Get(), src.data(), src.size(), flags);
}
