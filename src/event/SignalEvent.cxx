// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SignalEvent.hxx"
#include "system/LinuxFD.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <sys/signalfd.h>
#include <unistd.h>

SignalEvent::SignalEvent(EventLoop &loop, Callback _callback) noexcept
	:event(loop, BIND_THIS_METHOD(EventCallback)), callback(_callback)
{
	sigemptyset(&mask);
}

void
SignalEvent::Enable()
{
	assert(!IsDefined());

	event.Open(SocketDescriptor::FromFileDescriptor(CreateSignalFD(mask).Release()));
	event.ScheduleRead();

	sigprocmask(SIG_BLOCK, &mask, nullptr);
}

void
SignalEvent::Disable() noexcept
{
	if (!IsDefined())
		return;

	sigprocmask(SIG_UNBLOCK, &mask, nullptr);

	event.Close();
}

void
SignalEvent::EventCallback(unsigned) noexcept
{
	struct signalfd_siginfo info;
	ssize_t nbytes = read(event.GetSocket().Get(), &info, sizeof(info));
	if (nbytes <= 0) {
		Disable();
		return;
	}

	callback(info.ssi_signo);
}
