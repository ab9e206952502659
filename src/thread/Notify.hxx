// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "event/SocketEvent.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/BindMethod.hxx"

#include <atomic>

/**
 * Send notifications from a worker thread to the main thread.
 */
class Notify {
	typedef BoundMethod<void() noexcept> Callback;
	Callback callback;

	UniqueFileDescriptor event_fd;

	SocketEvent event;

	std::atomic_bool pending{false};

public:
	/**
	 * Throws on error.
	 */
	Notify(EventLoop &event_loop, Callback _callback);
	~Notify() noexcept;

	void Enable() noexcept {
		event.ScheduleRead();
	}

	void Disable() noexcept {
		event.Cancel();
	}

	/**
	 * May be called from any thread.
	 */
	void Signal() noexcept;

private:
	void EventFdCallback(unsigned events) noexcept;
};
