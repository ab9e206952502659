// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "io/FileDescriptor.hxx"

#include <cstddef>
#include <span>
#include <utility>

class SocketAddress;
class SocketPeerCredentials;

/**
 * An OO wrapper for a Berkeley or WinSock socket descriptor.
 */
class SocketDescriptor : protected FileDescriptor {
protected:
	explicit constexpr SocketDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	constexpr bool operator==(SocketDescriptor other) const noexcept {
		return fd == other.fd;
	}

	using FileDescriptor::IsDefined;
	using FileDescriptor::Get;
	using FileDescriptor::Set;
	using FileDescriptor::Steal;
	using FileDescriptor::SetUndefined;
	using FileDescriptor::SetNonBlocking;
	using FileDescriptor::Close;
	using FileDescriptor::WaitReadable;
	using FileDescriptor::WaitWritable;

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(FileDescriptor::Undefined());
	}

	/**
	 * Convert this object to a #FileDescriptor instance.  This is
	 * only possible on operating systems where socket descriptors
	 * are the same as file descriptors (i.e. not on Windows).
	 */
	constexpr const FileDescriptor &ToFileDescriptor() const noexcept {
		return *this;
	}

	static constexpr SocketDescriptor FromFileDescriptor(FileDescriptor fd) noexcept {
		return SocketDescriptor(fd);
	}

	/**
	 * @return true on success, false on error (with errno set)
	 */
	bool Create(int domain, int type, int protocol) noexcept;

	/**
	 * Like Create(), but enable non-blocking mode.
	 */
	bool CreateNonBlock(int domain, int type, int protocol) noexcept;

	[[gnu::pure]]
	int GetIntOption(int level, int name, int fallback) const noexcept;

	/**
	 * Returns the credentials of the peer process (SO_PEERCRED).
	 * On error, an undefined object is returned.
	 */
	[[gnu::pure]]
	SocketPeerCredentials GetPeerCredentials() const noexcept;

	bool SetOption(int level, int name,
		       const void *value, std::size_t size) const noexcept;

	bool SetBoolOption(int level, int name, bool value) const noexcept {
		const int v = value;
		return SetOption(level, name, &v, sizeof(v));
	}

	bool Bind(SocketAddress address) const noexcept;

	bool Listen(int backlog) const noexcept;

	/**
	 * Accept a new connection and enable non-blocking mode on it.
	 *
	 * @return the new socket descriptor or an "undefined" object
	 * on error (with errno set)
	 */
	SocketDescriptor AcceptNonBlock() const noexcept;

	bool Connect(SocketAddress address) const noexcept;

	ssize_t Receive(std::span<std::byte> dest, int flags=0) const noexcept;
	ssize_t Send(std::span<const std::byte> src, int flags=0) const noexcept;
};
