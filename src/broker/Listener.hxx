// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Connection.hxx"
#include "event/net/ServerSocket.hxx"
#include "event/SocketEvent.hxx"
#include "io/Logger.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/IntrusiveList.hxx"

#include <cstddef>
#include <memory>

namespace Broker {

class Handler;
class ShutdownSignal;

/**
 * Accepts connections on the broker socket and creates a
 * #Connection for each of them.  All connections share one
 * #Handler.
 *
 * When the #ShutdownSignal fires, the listener socket is closed and
 * idle connections are dropped; connections which are in the middle
 * of a request are allowed to finish it.
 */
class Listener final : ServerSocket {
	const LLogger logger{"listener"};

	const std::shared_ptr<Handler> handler;

	/**
	 * Our duplicate of the #ShutdownSignal descriptor.
	 */
	UniqueFileDescriptor shutdown_fd;

	SocketEvent shutdown_event;

	IntrusiveList<Connection> connections;

	const std::size_t max_request_size;

	bool shutting_down = false;

public:
	static constexpr std::size_t DEFAULT_MAX_REQUEST_SIZE = 1024 * 1024;

	/**
	 * Throws on error.
	 */
	Listener(EventLoop &event_loop, std::shared_ptr<Handler> _handler,
		 const ShutdownSignal &shutdown,
		 std::size_t _max_request_size=DEFAULT_MAX_REQUEST_SIZE);
	~Listener() noexcept;

	using ServerSocket::GetEventLoop;
	using ServerSocket::Listen;
	using ServerSocket::ListenPath;

	const auto &GetLogger() const noexcept {
		return logger;
	}

	Handler &GetHandler() const noexcept {
		return *handler;
	}

	std::size_t GetMaxRequestSize() const noexcept {
		return max_request_size;
	}

	bool IsShuttingDown() const noexcept {
		return shutting_down;
	}

	[[gnu::pure]]
	std::size_t GetConnectionCount() const noexcept {
		return connections.size();
	}

	/**
	 * Stop accepting new connections.  This is what happens when
	 * the #ShutdownSignal fires.
	 */
	void Shutdown() noexcept;

private:
	void OnShutdownSignal(unsigned events) noexcept;

	/* virtual methods from class ServerSocket */
	void OnAccept(UniqueSocketDescriptor fd) noexcept override;
	void OnAcceptError(std::exception_ptr ep) noexcept override;
};

} // namespace Broker
