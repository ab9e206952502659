// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Instance.hxx"
#include "../BusService.hxx"

namespace Broker {

Instance::Instance()
	:shutdown_listener(event_loop, BIND_THIS_METHOD(OnSignal)),
	 shutdown_event(event_loop, BIND_THIS_METHOD(OnShutdownSignal),
			SocketDescriptor::FromFileDescriptor(shutdown_signal.GetFileDescriptor()))
{
	shutdown_listener.Enable();
	shutdown_event.ScheduleRead();
}

Instance::~Instance() noexcept
{
	JoinThreads();
}

void
Instance::Spawn(BusService &service)
{
	threads.emplace_front([this, &service]{
		try {
			service.Serve(shutdown_signal);
		} catch (...) {
			logger(1, "Bus service failed: ",
			       std::current_exception());

			/* take the whole daemon down */
			shutdown_signal.Fire();
		}
	});
}

void
Instance::Run() noexcept
{
	event_loop.Run();
	JoinThreads();
}

void
Instance::JoinThreads() noexcept
{
	if (threads.empty())
		return;

	shutdown_signal.Fire();

	for (auto &i : threads)
		i.join();

	threads.clear();
}

void
Instance::OnSignal() noexcept
{
	shutdown_signal.Fire();
}

void
Instance::OnShutdownSignal(unsigned) noexcept
{
	logger(2, "shutting down");

	shutdown_listener.Disable();
	shutdown_event.Cancel();
}

} // namespace Broker
