// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Message.hxx"
#include "Error.hxx"

#include <new>
#include <stdexcept>

ODBus::Message
ODBus::Message::NewMethodCall(const char *destination,
			      const char *path,
			      const char *iface,
			      const char *method)
{
	Message msg(dbus_message_new_method_call(destination,
						 path, iface, method));
	if (!msg.IsDefined())
		throw std::bad_alloc{};

	return msg;
}

ODBus::Message
ODBus::Message::NewMethodReturn(DBusMessage &method_call)
{
	Message msg(dbus_message_new_method_return(&method_call));
	if (!msg.IsDefined())
		throw std::bad_alloc{};

	return msg;
}

ODBus::Message
ODBus::Message::NewError(DBusMessage &reply_to,
			 const char *error_name,
			 const char *error_message)
{
	Message msg(dbus_message_new_error(&reply_to, error_name,
					   error_message));
	if (!msg.IsDefined())
		throw std::bad_alloc{};

	return msg;
}

ODBus::Message
ODBus::Message::StealReply(DBusPendingCall &pending)
{
	Message result(dbus_pending_call_steal_reply(&pending));
	if (!result.IsDefined())
		throw std::runtime_error("Method call is not complete");

	return result;
}

ODBus::Message
ODBus::Message::Pop(DBusConnection &connection) noexcept
{
	return Message(dbus_connection_pop_message(&connection));
}

void
ODBus::Message::CheckThrowError()
{
	if (!IsError())
		return;

	Error error;
	dbus_set_error_from_message(error, msg);
	error.Throw("Method call failed");
}

void
ODBus::Message::SetSender(const char *sender)
{
	if (!dbus_message_set_sender(msg, sender))
		throw std::bad_alloc{};
}
