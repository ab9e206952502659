// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "net/UniqueSocketDescriptor.hxx"
#include "event/SocketEvent.hxx"

#include <exception>

struct SocketConfig;

/**
 * A socket that accepts incoming connections.
 */
class ServerSocket {
	SocketEvent event;

public:
	explicit ServerSocket(EventLoop &event_loop) noexcept
		:event(event_loop, BIND_THIS_METHOD(EventCallback)) {}

	~ServerSocket() noexcept;

	auto &GetEventLoop() const noexcept {
		return event.GetEventLoop();
	}

	bool IsDefined() const noexcept {
		return event.IsDefined();
	}

	void Listen(UniqueSocketDescriptor _fd) noexcept;

	/**
	 * Throws on error.
	 */
	void Listen(const SocketConfig &config);

	/**
	 * Create a stream socket bound to the given path (with an
	 * empty umask) and listen on it.
	 *
	 * Throws on error.
	 */
	void ListenPath(const char *path);

	/**
	 * Stop accepting connections and close the listener socket.
	 */
	void Close() noexcept {
		event.Close();
	}

	SocketDescriptor GetSocket() const noexcept {
		return event.GetSocket();
	}

protected:
	/**
	 * A new incoming connection has been established.
	 *
	 * @param fd the socket owned by the callee
	 */
	virtual void OnAccept(UniqueSocketDescriptor fd) noexcept = 0;
	virtual void OnAcceptError(std::exception_ptr ep) noexcept = 0;

private:
	void EventCallback(unsigned events) noexcept;
};
