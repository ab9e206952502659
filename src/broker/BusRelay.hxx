// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "SessionHandler.hxx"
#include "io/Logger.hxx"
#include "lib/dbus/Message.hxx"

#include <chrono>
#include <string>

namespace Broker {

/**
 * Relays Session Broker calls to the System Broker on the system
 * bus.  The System Broker identifies the caller from the bus
 * connection, so nothing but the arguments is passed.
 *
 * Each call opens its own private bus connection, so calls from
 * several threads do not share any state.
 */
class BusRelay final : public ForwardingSessionHandler {
	const LLogger logger{"bus-relay"};

	const std::chrono::milliseconds timeout;

	/**
	 * The address of the bus daemon; empty means the system
	 * bus.
	 */
	const std::string bus_address;

public:
	static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};

	explicit BusRelay(std::chrono::milliseconds _timeout=DEFAULT_TIMEOUT,
			  std::string _bus_address={}) noexcept
		:timeout(_timeout), bus_address(std::move(_bus_address)) {}

private:
	ODBus::Message Call(Operation operation,
			    std::string_view protocol_version,
			    std::string_view correlation_id,
			    std::string_view request_json);

protected:
	std::string Forward(Operation operation,
			    std::string_view protocol_version,
			    std::string_view correlation_id,
			    std::string_view request_json) override;
};

} // namespace Broker
