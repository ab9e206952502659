// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <dbus/dbus.h>

#include <utility>

namespace ODBus {

/**
 * OO wrapper for a #DBusConnection.
 */
class Connection {
	DBusConnection *c = nullptr;

	explicit Connection(DBusConnection *_c) noexcept
		:c(_c) {}

public:
	Connection() = default;

	Connection(const Connection &src) noexcept
		:c(dbus_connection_ref(src.c)) {}

	Connection(Connection &&src) noexcept
		:c(std::exchange(src.c, nullptr)) {}

	~Connection() noexcept {
		if (c != nullptr)
			dbus_connection_unref(c);
	}

	Connection &operator=(Connection &&src) noexcept {
		std::swap(c, src.c);
		return *this;
	}

	/**
	 * Obtain the shared connection to the system bus.
	 *
	 * Throws on error.
	 */
	static Connection GetSystem();

	/**
	 * Obtain the shared connection to the session bus.
	 *
	 * Throws on error.
	 */
	static Connection GetSession();

	/**
	 * Open a new private connection to the system bus.  It must
	 * be closed with Close() before it is released.
	 *
	 * Throws on error.
	 */
	static Connection GetSystemPrivate();

	/**
	 * Open a new private connection to the session bus.
	 *
	 * Throws on error.
	 */
	static Connection GetSessionPrivate();

	/**
	 * Open a new private connection to the bus daemon listening
	 * on the given address.  Call Register() before using it
	 * with a message bus.  It must be closed with Close() before
	 * it is released.
	 *
	 * Throws on error.
	 */
	static Connection OpenPrivate(const char *address);

	/**
	 * Send the "Hello" message to the bus daemon.
	 *
	 * Throws on error.
	 */
	void Register();

	/**
	 * Close a private connection.
	 */
	void Close() noexcept {
		dbus_connection_close(c);
	}

	/**
	 * Do not call _exit() when the bus daemon disconnects.
	 */
	void SetExitOnDisconnect(bool value) noexcept {
		dbus_connection_set_exit_on_disconnect(c, value);
	}

	operator DBusConnection *() noexcept {
		return c;
	}

	DBusConnection &operator*() noexcept {
		return *c;
	}

	operator bool() const noexcept {
		return c != nullptr;
	}
};

/**
 * Closes a private #Connection when this object goes out of scope.
 */
class ScopeCloseConnection {
	Connection &connection;

public:
	explicit ScopeCloseConnection(Connection &_connection) noexcept
		:connection(_connection) {}

	~ScopeCloseConnection() noexcept {
		connection.Close();
	}

	ScopeCloseConnection(const ScopeCloseConnection &) = delete;
	ScopeCloseConnection &operator=(const ScopeCloseConnection &) = delete;
};

} /* namespace ODBus */
