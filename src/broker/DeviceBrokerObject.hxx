// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "BusObject.hxx"
#include "io/Logger.hxx"

#include <memory>
#include <string>

namespace Broker {

class DeviceHandler;

/**
 * The "Device Capability Broker" object on the system bus.  The
 * caller-supplied session id is passed through; authorizing it is
 * the #DeviceHandler's job.
 */
class DeviceBrokerObject final : public BusObject {
	const LLogger logger{"device-broker"};

	const std::shared_ptr<DeviceHandler> handler;

	const std::string introspection;

public:
	explicit DeviceBrokerObject(std::shared_ptr<DeviceHandler> _handler);

	/* virtual methods from class BusObject */
	ODBus::Message HandleMethodCall(ODBus::Message &call) override;
};

} // namespace Broker
