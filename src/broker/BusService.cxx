// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "BusService.hxx"
#include "BusObject.hxx"
#include "ShutdownSignal.hxx"
#include "lib/dbus/Error.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <new>
#include <stdexcept>

namespace Broker {

/**
 * How long does one dispatch round block?  This is the maximum delay
 * before a fired #ShutdownSignal is noticed.
 */
static constexpr int DISPATCH_TIMEOUT_MS = 250;

static void
RequestName(DBusConnection *connection, const char *name)
{
	ODBus::Error error;
	const int result = dbus_bus_request_name(connection, name,
						 DBUS_NAME_FLAG_DO_NOT_QUEUE,
						 error);
	if (result < 0)
		error.Throw(name);

	if (result != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER &&
	    result != DBUS_REQUEST_NAME_REPLY_ALREADY_OWNER)
		throw FmtRuntimeError("D-Bus name '{}' is already owned", name);
}

BusService::BusService(ODBus::Connection _connection,
		       const char *name, const char *_path,
		       BusObject &_object)
	:logger(name),
	 connection(std::move(_connection)),
	 path(_path), object(_object)
{
	connection.SetExitOnDisconnect(false);

	try {
		RequestName(connection, name);

		static constexpr DBusObjectPathVTable vtable{
			.unregister_function = nullptr,
			.message_function = MessageFunction,
		};

		ODBus::Error error;
		if (!dbus_connection_try_register_object_path(connection, path,
							      &vtable, this,
							      error))
			error.Throw("Failed to register D-Bus object path");
	} catch (...) {
		/* libdbus insists on private connections being
		   closed before they are released */
		connection.Close();
		throw;
	}

	logger(3, "registered ", path);
}

BusService::~BusService() noexcept
{
	dbus_connection_unregister_object_path(connection, path);
	connection.Close();
}

void
BusService::Serve(const ShutdownSignal &shutdown)
{
	while (!shutdown.IsFired())
		if (!dbus_connection_read_write_dispatch(connection,
							 DISPATCH_TIMEOUT_MS))
			throw std::runtime_error("D-Bus connection closed");
}

DBusHandlerResult
BusService::HandleMessage(DBusMessage &msg) noexcept
{
	if (dbus_message_get_type(&msg) != DBUS_MESSAGE_TYPE_METHOD_CALL)
		return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;

	auto call = ODBus::Message::Ref(msg);

	try {
		auto reply = object.HandleMethodCall(call);
		if (!reply.IsDefined())
			return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;

		if (!dbus_message_get_no_reply(&msg) &&
		    !dbus_connection_send(connection, reply.Get(), nullptr))
			return DBUS_HANDLER_RESULT_NEED_MEMORY;

		return DBUS_HANDLER_RESULT_HANDLED;
	} catch (const std::bad_alloc &) {
		return DBUS_HANDLER_RESULT_NEED_MEMORY;
	} catch (...) {
		/* libdbus replies with an error to unhandled calls */
		logger(1, "Failed to handle method call: ",
		       std::current_exception());
		return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
	}
}

} // namespace Broker
