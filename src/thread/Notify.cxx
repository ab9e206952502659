// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Notify.hxx"
#include "system/LinuxFD.hxx"

#include <cstdint>
#include <span>

Notify::Notify(EventLoop &event_loop, Callback _callback)
	:callback(_callback),
	 event_fd(CreateEventFD()),
	 event(event_loop, BIND_THIS_METHOD(EventFdCallback),
	       SocketDescriptor::FromFileDescriptor(event_fd.ToFileDescriptor()))
{
}

Notify::~Notify() noexcept
{
	event.Cancel();
}

void
Notify::Signal() noexcept
{
	if (!pending.exchange(true)) {
		static constexpr uint64_t value = 1;
		[[maybe_unused]] ssize_t nbytes =
			event_fd.Write(std::as_bytes(std::span{&value, 1}));
	}
}

void
Notify::EventFdCallback(unsigned) noexcept
{
	uint64_t value;
	[[maybe_unused]] ssize_t nbytes =
		event_fd.Read(std::as_writable_bytes(std::span{&value, 1}));

	if (pending.exchange(false))
		callback();
}
