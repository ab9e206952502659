// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "system/EpollFD.hxx"
#include "util/IntrusiveList.hxx"

#include <chrono>

class SocketEvent;

/**
 * An event loop that polls for events on file/socket descriptors.
 *
 * This class is not thread-safe, all methods must be called from the
 * thread that runs it.
 *
 * @see SocketEvent
 */
class EventLoop final
{
	EpollFD poll_backend;

	using SocketList = IntrusiveList<SocketEvent>;

	/**
	 * A list of scheduled #SocketEvent instances, without those
	 * which are ready (these are in #ready_sockets).
	 */
	SocketList sockets;

	/**
	 * A list of #SocketEvent instances which have a non-zero
	 * "ready_flags" field and need to be dispatched.
	 */
	SocketList ready_sockets;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	bool IsEmpty() const noexcept {
		return sockets.empty() && ready_sockets.empty();
	}

	bool AddFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool ModifyFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool RemoveFD(int fd, SocketEvent &event) noexcept;

	/**
	 * Remove the given #SocketEvent after the file descriptor
	 * has been closed.  This is like RemoveFD(), but does not
	 * attempt to use #EPOLL_CTL_DEL.
	 */
	void AbandonFD(SocketEvent &event) noexcept;

	/**
	 * The main function of this class.  It will loop until there
	 * are no more registered events; to stop it, cancel (or close)
	 * all #SocketEvent instances.
	 */
	void Run() noexcept;

private:
	/**
	 * Call epoll_wait() and pass all returned events to
	 * SocketEvent::SetReadyFlags().
	 *
	 * @return true if one or more sockets have become ready
	 */
	bool Wait(std::chrono::milliseconds timeout) noexcept;
};
