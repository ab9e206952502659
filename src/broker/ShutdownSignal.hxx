// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "io/UniqueFileDescriptor.hxx"

#include <chrono>

namespace Broker {

/**
 * A process-wide "shutdown" broadcast.  It is backed by an eventfd
 * which is never drained: once fired, it stays readable forever, so
 * any number of subscribers (in any thread) observe it.
 */
class ShutdownSignal {
	UniqueFileDescriptor fd;

public:
	/**
	 * Throws on error.
	 */
	ShutdownSignal();

	ShutdownSignal(const ShutdownSignal &) = delete;
	ShutdownSignal &operator=(const ShutdownSignal &) = delete;

	/**
	 * The descriptor which becomes readable after Fire().  Event
	 * loop subscribers register it with a #SocketEvent.
	 */
	FileDescriptor GetFileDescriptor() const noexcept {
		return fd.ToFileDescriptor();
	}

	/**
	 * Duplicate the descriptor for another event loop subscriber.
	 * An epoll instance can watch each descriptor only once, but
	 * it can watch several duplicates of it.
	 *
	 * Throws on error.
	 */
	UniqueFileDescriptor Subscribe() const;

	/**
	 * This method is thread-safe and may be called multiple
	 * times.
	 */
	void Fire() noexcept;

	[[gnu::pure]]
	bool IsFired() const noexcept;

	/**
	 * Block until the signal fires or the timeout expires.
	 *
	 * @return true if the signal has fired
	 */
	bool Wait(std::chrono::milliseconds timeout) const noexcept;
};

} // namespace Broker
