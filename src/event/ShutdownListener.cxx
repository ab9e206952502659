// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ShutdownListener.hxx"

#include <signal.h>
#include <string.h>
#include <unistd.h>

inline void
ShutdownListener::SignalCallback(int signo) noexcept
{
	logger.Fmt(2, "caught SIG{}, shutting down (pid={})",
		   sigabbrev_np(signo), getpid());

	Disable();
	callback();
}

ShutdownListener::ShutdownListener(EventLoop &loop,
				   Callback _callback) noexcept
	:event(loop, BIND_THIS_METHOD(SignalCallback)),
	 callback(_callback)
{
	event.Add(SIGTERM);
	event.Add(SIGINT);
	event.Add(SIGQUIT);
}
