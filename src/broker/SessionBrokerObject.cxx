// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SessionBrokerObject.hxx"
#include "BusNames.hxx"
#include "SessionHandler.hxx"
#include "Error.hxx"

#include <array>
#include <new>

#include <string.h>

namespace Broker {

SessionBrokerObject::SessionBrokerObject(SessionHandler &_handler)
	:handler(_handler),
	 introspection(MakeOperationIntrospectionXml(SessionBroker::INTERFACE))
{
}

ODBus::Message
SessionBrokerObject::HandleMethodCall(ODBus::Message &call)
{
	if (auto reply = HandleIntrospect(call, introspection);
	    reply.IsDefined())
		return reply;

	const char *interface = call.GetInterface();
	const char *member = call.GetMember();
	if ((interface != nullptr &&
	     strcmp(interface, SessionBroker::INTERFACE) != 0) ||
	    member == nullptr)
		return MakeUnknownMethodReply(call);

	const auto operation = ParseOperation(member);
	if (!operation)
		return MakeUnknownMethodReply(call);

	try {
		std::array<const char *, 3> args;
		GetStringArgs(call, args);

		logger.Fmt(3, "{} correlation_id={}", member, args[1]);

		const auto result = Invoke(handler, *operation,
					   args[0], args[1], args[2]);
		return MakeStringReply(call, result);
	} catch (const std::bad_alloc &) {
		throw;
	} catch (...) {
		const auto error = ToError(std::current_exception());
		logger.Fmt(2, "{} failed: {}", member, error.what());
		return MakeErrorReply(call, error);
	}
}

} // namespace Broker
