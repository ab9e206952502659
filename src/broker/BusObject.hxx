// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "lib/dbus/Message.hxx"

#include <span>
#include <string>
#include <string_view>

namespace Broker {

class Error;

/**
 * An object exported on the bus by #BusService.
 */
class BusObject {
public:
	virtual ~BusObject() noexcept = default;

	/**
	 * Handle a method call addressed to this object.
	 *
	 * @return the reply, or an undefined #ODBus::Message if the
	 * call was not addressed to one of this object's interfaces
	 *
	 * Throws std::bad_alloc if libdbus runs out of memory;
	 * failures of the operation itself are returned as error
	 * replies
	 */
	virtual ODBus::Message HandleMethodCall(ODBus::Message &call) = 0;
};

/**
 * Describes one method for the introspection data.
 */
struct BusMethodDescription {
	const char *name;

	/**
	 * Names of the "in" arguments (all of type string).
	 */
	std::span<const char *const> arguments;
};

/**
 * Generate the org.freedesktop.DBus.Introspectable XML for an
 * object which implements one interface whose methods all return
 * one string called "result".
 */
std::string
MakeIntrospectionXml(const char *interface,
		     std::span<const BusMethodDescription> methods);

/**
 * Introspection data for the System and Session Broker interfaces,
 * which implement all operations of #Operation.
 */
std::string
MakeOperationIntrospectionXml(const char *interface);

/**
 * Handle org.freedesktop.DBus.Introspectable.Introspect.
 *
 * @return the reply or an undefined #ODBus::Message if this is not
 * an introspection call
 */
ODBus::Message
HandleIntrospect(ODBus::Message &call, std::string_view xml);

/**
 * Read the given number of string arguments.  If the call does not
 * have exactly this signature, throws #Error with
 * #ErrorCode::INVALID_ARGS.
 */
void
GetStringArgs(ODBus::Message &call, std::span<const char *> args);

/**
 * Build a reply with one string argument.  Throws #Error with
 * #ErrorCode::FAILED if the value is not a valid D-Bus string.
 */
ODBus::Message
MakeStringReply(ODBus::Message &call, const std::string &value);

/**
 * Build the error reply for the given #Error.  An error message which
 * is not valid UTF-8 is replaced.
 */
ODBus::Message
MakeErrorReply(ODBus::Message &call, const Error &error);

ODBus::Message
MakeUnknownMethodReply(ODBus::Message &call);

} // namespace Broker
