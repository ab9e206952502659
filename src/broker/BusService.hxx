// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "lib/dbus/Connection.hxx"
#include "io/Logger.hxx"

namespace Broker {

class BusObject;
class ShutdownSignal;

/**
 * Exports one #BusObject under a well-known name on a (private) bus
 * connection and dispatches incoming method calls to it.
 */
class BusService {
	const Logger logger;

	ODBus::Connection connection;

	const char *const path;

	BusObject &object;

public:
	/**
	 * Claim the well-known name and register the object path.
	 *
	 * Throws if the name is already owned by another connection
	 * or if registering fails.
	 *
	 * @param _connection a private bus connection; it is closed
	 * by the destructor
	 */
	BusService(ODBus::Connection _connection,
		   const char *name, const char *_path,
		   BusObject &_object);

	~BusService() noexcept;

	BusService(const BusService &) = delete;
	BusService &operator=(const BusService &) = delete;

	/**
	 * Dispatch method calls until the #ShutdownSignal fires.
	 * This blocks the calling thread.
	 *
	 * Throws if the bus connection gets closed.
	 */
	void Serve(const ShutdownSignal &shutdown);

private:
	DBusHandlerResult HandleMessage(DBusMessage &msg) noexcept;

	static DBusHandlerResult MessageFunction(DBusConnection *,
						 DBusMessage *msg,
						 void *user_data) noexcept {
		auto &service = *(BusService *)user_data;
		return service.HandleMessage(*msg);
	}
};

} // namespace Broker
