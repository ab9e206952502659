// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Credentials.hxx"
#include "Error.hxx"
#include "lib/dbus/Error.hxx"
#include "net/SocketDescriptor.hxx"
#include "net/PeerCredentials.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

namespace Broker {

uid_t
ResolvePeerUid(SocketDescriptor s)
{
	const auto cred = s.GetPeerCredentials();
	if (!cred.IsDefined())
		throw Error{ErrorCode::ACCESS_DENIED,
			    "Unable to verify peer credentials"};

	return cred.GetUid();
}

uid_t
BusSenderUidLookup::LookupSenderUid(const char *sender)
{
	ODBus::Error error;
	const unsigned long uid = dbus_bus_get_unix_user(connection,
							 sender, error);
	if (uid == (unsigned long)-1)
		error.Throw("GetConnectionUnixUser failed");

	return uid;
}

uid_t
ResolveBusCaller(SenderUidLookup &lookup, const char *sender)
{
	if (sender == nullptr || *sender == 0)
		throw Error{ErrorCode::ACCESS_DENIED,
			    "Method call has no sender"};

	try {
		return lookup.LookupSenderUid(sender);
	} catch (...) {
		throw Error{ErrorCode::ACCESS_DENIED,
			    fmt::format("Unable to determine the uid of {}: {}",
					sender,
					GetFullMessage(std::current_exception()))};
	}
}

} // namespace Broker
