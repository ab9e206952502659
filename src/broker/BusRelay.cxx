// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "BusRelay.hxx"
#include "BusNames.hxx"
#include "Error.hxx"
#include "lib/dbus/Connection.hxx"
#include "lib/dbus/Message.hxx"
#include "lib/dbus/AppendIter.hxx"
#include "lib/dbus/PendingCall.hxx"
#include "lib/dbus/Error.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

namespace Broker {

ODBus::Message
BusRelay::Call(Operation operation,
	       std::string_view protocol_version,
	       std::string_view correlation_id,
	       std::string_view request_json)
{
	auto connection = bus_address.empty()
		? ODBus::Connection::GetSystemPrivate()
		: ODBus::Connection::OpenPrivate(bus_address.c_str());
	const ODBus::ScopeCloseConnection close_connection{connection};

	connection.SetExitOnDisconnect(false);

	if (!bus_address.empty())
		connection.Register();

	auto msg = ODBus::Message::NewMethodCall(SystemBroker::NAME,
						 SystemBroker::PATH,
						 SystemBroker::INTERFACE,
						 ToString(operation));

	/* libdbus wants null-terminated strings */
	const std::string a{protocol_version}, b{correlation_id},
		c{request_json};
	ODBus::AppendMessageIter(*msg.Get())
		.Append(a.c_str())
		.Append(b.c_str())
		.Append(c.c_str());

	auto pending = ODBus::PendingCall::SendWithReply(connection,
							 msg.Get(),
							 int(timeout.count()));
	dbus_connection_flush(connection);
	pending.Block();

	return ODBus::Message::StealReply(*pending.Get());
}

std::string
BusRelay::Forward(Operation operation,
		  std::string_view protocol_version,
		  std::string_view correlation_id,
		  std::string_view request_json)
{
	logger.Fmt(4, "{} correlation_id={}", ToString(operation),
		   correlation_id);

	ODBus::Message reply;

	try {
		reply = Call(operation, protocol_version, correlation_id,
			     request_json);
	} catch (const std::bad_alloc &) {
		throw;
	} catch (...) {
		throw Error{ErrorCode::FAILED,
			    fmt::format("System Broker call failed: {}",
					GetFullMessage(std::current_exception()))};
	}

	if (reply.IsError()) {
		ODBus::Error error;
		dbus_set_error_from_message(error, reply.Get());
		throw Error{ErrorCodeFromDBusName(reply.GetErrorName()),
			    error.GetMessage() != nullptr
			    ? error.GetMessage()
			    : reply.GetErrorName()};
	}

	ODBus::Error error;
	const char *result;
	if (!reply.GetArgs(error, DBUS_TYPE_STRING, &result))
		throw Error{ErrorCode::FAILED,
			    fmt::format("Malformed System Broker reply: {}",
					error.GetMessage())};

	return result;
}

} // namespace Broker
