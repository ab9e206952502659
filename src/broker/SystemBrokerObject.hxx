// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "BusObject.hxx"
#include "io/Logger.hxx"

#include <memory>
#include <string>

namespace Broker {

class Handler;
class SenderUidLookup;

/**
 * The "System Broker" object on the system bus.  It determines the
 * uid of each caller and passes it to the #Handler.  Calls whose
 * sender cannot be identified never reach the #Handler.
 */
class SystemBrokerObject final : public BusObject {
	const LLogger logger{"system-broker"};

	const std::shared_ptr<Handler> handler;

	SenderUidLookup &uid_lookup;

	const std::string introspection;

public:
	SystemBrokerObject(std::shared_ptr<Handler> _handler,
			   SenderUidLookup &_uid_lookup);

	/* virtual methods from class BusObject */
	ODBus::Message HandleMethodCall(ODBus::Message &call) override;
};

} // namespace Broker
