// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Listener.hxx"
#include "Credentials.hxx"
#include "ShutdownSignal.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/DeleteDisposer.hxx"

namespace Broker {

Listener::Listener(EventLoop &event_loop, std::shared_ptr<Handler> _handler,
		   const ShutdownSignal &shutdown,
		   std::size_t _max_request_size)
	:ServerSocket(event_loop),
	 handler(std::move(_handler)),
	 shutdown_fd(shutdown.Subscribe()),
	 shutdown_event(event_loop, BIND_THIS_METHOD(OnShutdownSignal),
			SocketDescriptor::FromFileDescriptor(shutdown_fd.ToFileDescriptor())),
	 max_request_size(_max_request_size)
{
	shutdown_event.ScheduleRead();
}

Listener::~Listener() noexcept
{
	shutdown_event.Cancel();
	connections.clear_and_dispose(DeleteDisposer{});
}

void
Listener::Shutdown() noexcept
{
	if (shutting_down)
		return;

	shutting_down = true;

	logger(2, "shutting down");

	shutdown_event.Cancel();
	ServerSocket::Close();

	/* connections which are in the middle of a request are not
	   cancelled; they close themselves after the response has
	   been sent.  A partially received request is discarded. */
	connections.remove_and_dispose_if([](const Connection &c){
		return !c.IsBusy();
	}, DeleteDisposer{});
}

void
Listener::OnShutdownSignal(unsigned) noexcept
{
	Shutdown();
}

void
Listener::OnAccept(UniqueSocketDescriptor fd) noexcept
{
	uid_t uid;

	try {
		uid = ResolvePeerUid(fd);
	} catch (...) {
		logger(1, "Unable to verify peer credentials: ",
		       std::current_exception());
		return;
	}

	logger.Fmt(4, "accepted connection from uid={}", uid);

	Connection *c;
	try {
		c = new Connection(*this, std::move(fd), uid);
	} catch (...) {
		logger(1, "Failed to set up connection: ",
		       std::current_exception());
		return;
	}

	connections.push_back(*c);
}

void
Listener::OnAcceptError(std::exception_ptr ep) noexcept
{
	logger(1, "Error while handling connection: ", ep);
}

} // namespace Broker
