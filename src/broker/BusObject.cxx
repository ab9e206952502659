// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "BusObject.hxx"
#include "Error.hxx"
#include "Operation.hxx"
#include "lib/dbus/AppendIter.hxx"

#include <fmt/format.h>

#include <dbus/dbus-protocol.h>

#include <array>
#include <iterator>

namespace Broker {

std::string
MakeIntrospectionXml(const char *interface,
		     std::span<const BusMethodDescription> methods)
{
	fmt::memory_buffer b;
	auto out = std::back_inserter(b);

	fmt::format_to(out, "{}<node>\n", DBUS_INTROSPECT_1_0_XML_DOCTYPE_DECL_NODE);
	fmt::format_to(out,
		       "  <interface name=\"{}\">\n",
		       DBUS_INTERFACE_INTROSPECTABLE);
	fmt::format_to(out,
		       "    <method name=\"Introspect\">\n"
		       "      <arg name=\"xml_data\" type=\"s\" direction=\"out\"/>\n"
		       "    </method>\n"
		       "  </interface>\n");

	fmt::format_to(out, "  <interface name=\"{}\">\n", interface);

	for (const auto &m : methods) {
		fmt::format_to(out, "    <method name=\"{}\">\n", m.name);

		for (const char *arg : m.arguments)
			fmt::format_to(out,
				       "      <arg name=\"{}\" type=\"s\" direction=\"in\"/>\n",
				       arg);

		fmt::format_to(out,
			       "      <arg name=\"result\" type=\"s\" direction=\"out\"/>\n"
			       "    </method>\n");
	}

	fmt::format_to(out, "  </interface>\n</node>\n");

	return fmt::to_string(b);
}

std::string
MakeOperationIntrospectionXml(const char *interface)
{
	static constexpr std::array<const char *, 3> arguments{
		"protocol_version", "correlation_id", "request_json",
	};

	std::array<BusMethodDescription, all_operations.size()> methods;
	for (std::size_t i = 0; i < methods.size(); ++i)
		methods[i] = {ToString(all_operations[i]), arguments};

	return MakeIntrospectionXml(interface, methods);
}

ODBus::Message
HandleIntrospect(ODBus::Message &call, std::string_view xml)
{
	if (!call.IsMethodCall(DBUS_INTERFACE_INTROSPECTABLE, "Introspect"))
		return {};

	return MakeStringReply(call, std::string{xml});
}

void
GetStringArgs(ODBus::Message &call, std::span<const char *> args)
{
	DBusMessageIter iter;
	if (!dbus_message_iter_init(call.Get(), &iter)) {
		/* no arguments at all */
		if (!args.empty())
			throw Error{ErrorCode::INVALID_ARGS,
				    fmt::format("Expected {} string arguments",
						args.size())};
		return;
	}

	for (auto &i : args) {
		if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING)
			throw Error{ErrorCode::INVALID_ARGS,
				    fmt::format("Expected {} string arguments",
						args.size())};

		dbus_message_iter_get_basic(&iter, &i);
		dbus_message_iter_next(&iter);
	}

	if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_INVALID)
		throw Error{ErrorCode::INVALID_ARGS,
			    fmt::format("Expected {} string arguments",
					args.size())};
}

ODBus::Message
MakeStringReply(ODBus::Message &call, const std::string &value)
{
	/* a D-Bus string ends at the first null byte */
	if (value.find('\0') != value.npos)
		throw Error{ErrorCode::FAILED, "Result contains a null byte"};

	if (!dbus_validate_utf8(value.c_str(), nullptr))
		throw Error{ErrorCode::FAILED, "Result is not valid UTF-8"};

	auto reply = ODBus::Message::NewMethodReturn(*call.Get());
	ODBus::AppendMessageIter(*reply.Get()).Append(value.c_str());
	return reply;
}

ODBus::Message
MakeErrorReply(ODBus::Message &call, const Error &error)
{
	/* libdbus aborts the process on malformed strings */
	const char *message = error.what();
	if (!dbus_validate_utf8(message, nullptr))
		message = "(error message is not valid UTF-8)";

	return ODBus::Message::NewError(*call.Get(),
					ToDBusErrorName(error.GetCode()),
					message);
}

ODBus::Message
MakeUnknownMethodReply(ODBus::Message &call)
{
	const auto msg = fmt::format("Unknown method '{}' on interface '{}'",
				     call.GetMember() != nullptr ? call.GetMember() : "",
				     call.GetInterface() != nullptr ? call.GetInterface() : "");
	return ODBus::Message::NewError(*call.Get(),
					DBUS_ERROR_UNKNOWN_METHOD,
					msg.c_str());
}

} // namespace Broker
