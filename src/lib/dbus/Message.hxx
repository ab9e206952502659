// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <dbus/dbus.h>

#include <utility>

namespace ODBus {

/**
 * OO wrapper for a #DBusMessage which owns one reference.
 */
class Message {
	DBusMessage *msg = nullptr;

	explicit Message(DBusMessage *_msg) noexcept
		:msg(_msg) {}

public:
	Message() noexcept = default;

	Message(Message &&src) noexcept
		:msg(std::exchange(src.msg, nullptr)) {}

	~Message() noexcept {
		if (msg != nullptr)
			dbus_message_unref(msg);
	}

	Message &operator=(Message &&src) noexcept {
		std::swap(msg, src.msg);
		return *this;
	}

	/**
	 * Adopt an existing reference.
	 */
	static Message Adopt(DBusMessage *_msg) noexcept {
		return Message(_msg);
	}

	/**
	 * Acquire a new reference to an existing message.
	 */
	static Message Ref(DBusMessage &_msg) noexcept {
		return Message(dbus_message_ref(&_msg));
	}

	bool IsDefined() const noexcept {
		return msg != nullptr;
	}

	DBusMessage *Get() noexcept {
		return msg;
	}

	/**
	 * Throws std::bad_alloc on error.
	 */
	static Message NewMethodCall(const char *destination,
				     const char *path,
				     const char *iface,
				     const char *method);

	/**
	 * Throws std::bad_alloc on error.
	 */
	static Message NewMethodReturn(DBusMessage &method_call);

	/**
	 * Throws std::bad_alloc on error.
	 */
	static Message NewError(DBusMessage &reply_to,
				const char *error_name,
				const char *error_message);

	/**
	 * Obtain the reply of a #DBusPendingCall which has completed.
	 *
	 * Throws on error.
	 */
	static Message StealReply(DBusPendingCall &pending);

	static Message Pop(DBusConnection &connection) noexcept;

	int GetType() const noexcept {
		return dbus_message_get_type(msg);
	}

	bool IsError() const noexcept {
		return GetType() == DBUS_MESSAGE_TYPE_ERROR;
	}

	/**
	 * If this is an error message, throw it as a C++ exception.
	 */
	void CheckThrowError();

	[[gnu::pure]]
	bool IsMethodCall(const char *iface, const char *method) const noexcept {
		return dbus_message_is_method_call(msg, iface, method);
	}

	[[gnu::pure]]
	bool IsSignal(const char *iface, const char *name) const noexcept {
		return dbus_message_is_signal(msg, iface, name);
	}

	const char *GetSender() const noexcept {
		return dbus_message_get_sender(msg);
	}

	/**
	 * Throws std::bad_alloc on error.
	 */
	void SetSender(const char *sender);

	const char *GetInterface() const noexcept {
		return dbus_message_get_interface(msg);
	}

	const char *GetMember() const noexcept {
		return dbus_message_get_member(msg);
	}

	const char *GetPath() const noexcept {
		return dbus_message_get_path(msg);
	}

	const char *GetErrorName() const noexcept {
		return dbus_message_get_error_name(msg);
	}

	template<typename... Args>
	bool GetArgs(DBusError &error, Args... args) noexcept {
		return dbus_message_get_args(msg, &error,
					     std::forward<Args>(args)...,
					     DBUS_TYPE_INVALID);
	}
};

} /* namespace ODBus */
