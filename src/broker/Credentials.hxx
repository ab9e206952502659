// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "lib/dbus/Connection.hxx"

#include <utility>

#include <sys/types.h>

class SocketDescriptor;

namespace Broker {

/**
 * Determine the uid of the process on the other end of a local
 * stream socket from the credentials the kernel attached to the
 * connection (SO_PEERCRED).
 *
 * Throws #Error with #ErrorCode::ACCESS_DENIED if the credentials
 * are not available.
 */
uid_t
ResolvePeerUid(SocketDescriptor s);

/**
 * Maps a D-Bus sender (unique connection name) to a uid.
 */
class SenderUidLookup {
public:
	virtual ~SenderUidLookup() noexcept = default;

	/**
	 * Throws on error.
	 */
	virtual uid_t LookupSenderUid(const char *sender) = 0;
};

/**
 * Asks the bus daemon (org.freedesktop.DBus.GetConnectionUnixUser).
 */
class BusSenderUidLookup final : public SenderUidLookup {
	ODBus::Connection connection;

public:
	explicit BusSenderUidLookup(ODBus::Connection _connection) noexcept
		:connection(std::move(_connection)) {}

	uid_t LookupSenderUid(const char *sender) override;
};

/**
 * Determine the uid of the sender of a bus method call.  This must be
 * done for each call; the bus supplies the sender per message.
 *
 * Throws #Error with #ErrorCode::ACCESS_DENIED if there is no sender
 * or if the lookup fails.
 */
uid_t
ResolveBusCaller(SenderUidLookup &lookup, const char *sender);

} // namespace Broker
