// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Connection.hxx"
#include "Listener.hxx"
#include "Handler.hxx"
#include "Codec.hxx"
#include "Request.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "net/SocketError.hxx"
#include "util/SpanCast.hxx"

#include <array>
#include <utility>

namespace Broker {

Connection::Connection(Listener &_listener,
		       UniqueSocketDescriptor fd, uid_t _uid)
	:listener(_listener),
	 logger(listener.GetLogger(), "connection"),
	 event(listener.GetEventLoop(), BIND_THIS_METHOD(OnSocketReady),
	       fd.Release()),
	 uid(_uid),
	 notify(listener.GetEventLoop(), BIND_THIS_METHOD(OnHandlerDone))
{
	event.ScheduleRead();
}

Connection::~Connection() noexcept
{
	/* the worker cannot be cancelled; wait for the handler to
	   return before freeing what it uses */
	if (worker.joinable())
		worker.join();

	event.Close();
}

void
Connection::OnError(std::exception_ptr ep) noexcept
{
	logger(1, ep);
	Destroy();
}

inline void
Connection::TryRead()
{
	std::array<std::byte, 4096> buffer;
	const auto nbytes = event.GetSocket().Receive(buffer);
	if (nbytes < 0) {
		const auto e = GetSocketError();
		if (IsSocketErrorReceiveWouldBlock(e))
			return;

		throw MakeSocketError(e, "Failed to receive");
	}

	if (nbytes == 0) {
		if (input.empty())
			logger.Fmt(4, "Disconnecting client uid={}", uid);
		else
			logger.Fmt(4, "Client uid={} disconnected with {} bytes of an incomplete request",
				   uid, input.size());

		Destroy();
		return;
	}

	input.append(ToStringView(std::span{buffer}.first(nbytes)));

	if (input.size() > listener.GetMaxRequestSize()) {
		logger.Fmt(2, "Request from uid={} is too large, closing", uid);
		Destroy();
		return;
	}

	if (auto request = DecodeRequest(input))
		Dispatch(*request);
}

inline void
Connection::Dispatch(const Request &request)
{
	logger.Fmt(3, "{} correlation_id={} uid={}",
		   ToString(request.operation), request.correlation_id, uid);

	/* stop reading until the response has been sent */
	event.CancelRead();

	notify.Enable();
	worker = std::thread(&Connection::RunHandler, this, request);
}

void
Connection::RunHandler(Request request) noexcept
{
	try {
		output = Invoke(listener.GetHandler(), request, uid);
	} catch (...) {
		worker_error = std::current_exception();
	}

	notify.Signal();
}

void
Connection::OnHandlerDone() noexcept
try {
	notify.Disable();
	worker.join();

	if (worker_error)
		std::rethrow_exception(std::exchange(worker_error, {}));

	output_position = 0;
	TryWrite();
} catch (...) {
	OnError(std::current_exception());
}

void
Connection::TryWrite()
{
	while (output_position < output.size()) {
		const auto nbytes = event.GetSocket().Send(AsBytes(std::string_view{output}.substr(output_position)));
		if (nbytes < 0) {
			const auto e = GetSocketError();
			if (IsSocketErrorSendWouldBlock(e)) {
				event.ScheduleWrite();
				return;
			}

			throw MakeSocketError(e, "Failed to send");
		}

		output_position += nbytes;
	}

	logger(4, "flushed response");

	output.clear();
	output_position = 0;

	if (listener.IsShuttingDown()) {
		Destroy();
		return;
	}

	event.CancelWrite();
	event.ScheduleRead();
}

void
Connection::OnSocketReady(unsigned events) noexcept
try {
	if (event.IsWritePending()) {
		TryWrite();
		return;
	}

	if (events & (SocketEvent::READ|SocketEvent::HANGUP|SocketEvent::ERROR))
		TryRead();
} catch (...) {
	OnError(std::current_exception());
}

} // namespace Broker
