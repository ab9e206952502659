// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SystemBrokerObject.hxx"
#include "BusNames.hxx"
#include "Credentials.hxx"
#include "Handler.hxx"
#include "Error.hxx"

#include <array>
#include <new>

#include <string.h>

namespace Broker {

SystemBrokerObject::SystemBrokerObject(std::shared_ptr<Handler> _handler,
				       SenderUidLookup &_uid_lookup)
	:handler(std::move(_handler)), uid_lookup(_uid_lookup),
	 introspection(MakeOperationIntrospectionXml(SystemBroker::INTERFACE))
{
}

ODBus::Message
SystemBrokerObject::HandleMethodCall(ODBus::Message &call)
{
	if (auto reply = HandleIntrospect(call, introspection);
	    reply.IsDefined())
		return reply;

	const char *interface = call.GetInterface();
	const char *member = call.GetMember();
	if ((interface != nullptr &&
	     strcmp(interface, SystemBroker::INTERFACE) != 0) ||
	    member == nullptr)
		return MakeUnknownMethodReply(call);

	const auto operation = ParseOperation(member);
	if (!operation)
		return MakeUnknownMethodReply(call);

	try {
		std::array<const char *, 3> args;
		GetStringArgs(call, args);

		const uid_t uid = ResolveBusCaller(uid_lookup,
						   call.GetSender());

		logger.Fmt(3, "{} correlation_id={} uid={}",
			   member, args[1], uid);

		const auto result = Invoke(*handler, *operation,
					   args[0], args[1], args[2], uid);
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
