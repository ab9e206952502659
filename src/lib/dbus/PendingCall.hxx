// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <dbus/dbus.h>

#include <new>
#include <stdexcept>
#include <utility>

namespace ODBus {

/**
 * OO wrapper for a #DBusPendingCall which owns one reference.
 */
class PendingCall {
	DBusPendingCall *pending = nullptr;

	explicit PendingCall(DBusPendingCall *_pending) noexcept
		:pending(_pending) {}

public:
	PendingCall() noexcept = default;

	PendingCall(PendingCall &&src) noexcept
		:pending(std::exchange(src.pending, nullptr)) {}

	~PendingCall() noexcept {
		if (pending != nullptr)
			dbus_pending_call_unref(pending);
	}

	PendingCall &operator=(PendingCall &&src) noexcept {
		std::swap(pending, src.pending);
		return *this;
	}

	DBusPendingCall *Get() noexcept {
		return pending;
	}

	/**
	 * Send a message and obtain a handle for the reply.
	 *
	 * @param timeout_ms the reply timeout in milliseconds or -1
	 * for the libdbus default
	 *
	 * Throws std::bad_alloc on error.
	 */
	static PendingCall SendWithReply(DBusConnection *connection,
					 DBusMessage *message,
					 int timeout_ms=-1) {
		DBusPendingCall *pending;
		if (!dbus_connection_send_with_reply(connection,
						     message,
						     &pending,
						     timeout_ms))
			throw std::bad_alloc{};

		/* a nullptr pending call means the connection is
		   already disconnected */
		if (pending == nullptr)
			throw std::runtime_error("D-Bus connection is closed");

		return PendingCall(pending);
	}

	void Block() noexcept {
		dbus_pending_call_block(pending);
	}
};

} /* namespace ODBus */
