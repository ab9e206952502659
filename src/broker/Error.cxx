// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Error.hxx"
#include "util/Exception.hxx"

#include <dbus/dbus-protocol.h>

#include <string.h>

namespace Broker {

const char *
ToDBusErrorName(ErrorCode code) noexcept
{
	switch (code) {
	case ErrorCode::FAILED:
		break;

	case ErrorCode::ACCESS_DENIED:
		return DBUS_ERROR_ACCESS_DENIED;

	case ErrorCode::TIMEOUT:
		return DBUS_ERROR_TIMEOUT;

	case ErrorCode::NOT_SUPPORTED:
		return DBUS_ERROR_NOT_SUPPORTED;

	case ErrorCode::INVALID_ARGS:
		return DBUS_ERROR_INVALID_ARGS;
	}

	return DBUS_ERROR_FAILED;
}

ErrorCode
ErrorCodeFromDBusName(const char *name) noexcept
{
	if (name == nullptr)
		return ErrorCode::FAILED;

	if (strcmp(name, DBUS_ERROR_ACCESS_DENIED) == 0 ||
	    strcmp(name, DBUS_ERROR_AUTH_FAILED) == 0)
		return ErrorCode::ACCESS_DENIED;

	/* libdbus reports a missing reply as "NoReply" */
	if (strcmp(name, DBUS_ERROR_TIMEOUT) == 0 ||
	    strcmp(name, DBUS_ERROR_TIMED_OUT) == 0 ||
	    strcmp(name, DBUS_ERROR_NO_REPLY) == 0)
		return ErrorCode::TIMEOUT;

	if (strcmp(name, DBUS_ERROR_NOT_SUPPORTED) == 0)
		return ErrorCode::NOT_SUPPORTED;

	if (strcmp(name, DBUS_ERROR_INVALID_ARGS) == 0)
		return ErrorCode::INVALID_ARGS;

	return ErrorCode::FAILED;
}

Error
ToError(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const Error &e) {
		return e;
	} catch (...) {
		return Error{ErrorCode::FAILED, GetFullMessage(ep)};
	}
}

} // namespace Broker
