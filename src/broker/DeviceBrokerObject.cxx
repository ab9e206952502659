// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "DeviceBrokerObject.hxx"
#include "BusNames.hxx"
#include "DeviceHandler.hxx"
#include "Error.hxx"

#include <array>
#include <new>

#include <string.h>

namespace Broker {

static std::string
MakeDeviceIntrospectionXml()
{
	static constexpr std::array<const char *, 2> arguments{
		"session_id", "request_json",
	};

	std::array<BusMethodDescription, all_device_operations.size()> methods;
	for (std::size_t i = 0; i < methods.size(); ++i)
		methods[i] = {ToString(all_device_operations[i]), arguments};

	return MakeIntrospectionXml(DeviceBroker::INTERFACE, methods);
}

DeviceBrokerObject::DeviceBrokerObject(std::shared_ptr<DeviceHandler> _handler)
	:handler(std::move(_handler)),
	 introspection(MakeDeviceIntrospectionXml())
{
}

ODBus::Message
DeviceBrokerObject::HandleMethodCall(ODBus::Message &call)
{
	if (auto reply = HandleIntrospect(call, introspection);
	    reply.IsDefined())
		return reply;

	const char *interface = call.GetInterface();
	const char *member = call.GetMember();
	if ((interface != nullptr &&
	     strcmp(interface, DeviceBroker::INTERFACE) != 0) ||
	    member == nullptr)
		return MakeUnknownMethodReply(call);

	const auto operation = ParseDeviceOperation(member);
	if (!operation)
		return MakeUnknownMethodReply(call);

	try {
		std::array<const char *, 2> args;
		GetStringArgs(call, args);

		logger.Fmt(3, "{} sender={}", member,
			   call.GetSender() != nullptr ? call.GetSender() : "?");

		const auto result = Invoke(*handler, *operation,
					   args[0], args[1]);
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
