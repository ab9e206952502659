// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "SignalEvent.hxx"
#include "io/Logger.hxx"

/**
 * Listener for shutdown signals (SIGTERM, SIGINT, SIGQUIT).  The
 * callback is invoked only once; after that, the signals are
 * unblocked again, so a second signal terminates the process.
 */
class ShutdownListener {
	const LLogger logger{"signal"};

	SignalEvent event;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

public:
	ShutdownListener(EventLoop &loop, Callback _callback) noexcept;

	ShutdownListener(const ShutdownListener &) = delete;
	ShutdownListener &operator=(const ShutdownListener &) = delete;

	void Enable() {
		event.Enable();
	}

	void Disable() noexcept {
		event.Disable();
	}

private:
	void SignalCallback(int signo) noexcept;
};
