// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "BusObject.hxx"
#include "io/Logger.hxx"

#include <string>

namespace Broker {

class SessionHandler;

/**
 * The "Session Broker" object on the session bus.  It has the same
 * methods as the System Broker, but does not identify the caller;
 * it only forwards to a #SessionHandler (usually a relay client).
 */
class SessionBrokerObject final : public BusObject {
	const LLogger logger{"session-broker"};

	SessionHandler &handler;

	const std::string introspection;

public:
	explicit SessionBrokerObject(SessionHandler &_handler);

	/* virtual methods from class BusObject */
	ODBus::Message HandleMethodCall(ODBus::Message &call) override;
};

} // namespace Broker
