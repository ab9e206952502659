// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Operation.hxx"

#include <string>

namespace Broker {

/**
 * One decoded request envelope.
 */
struct Request {
	Operation operation;

	std::string protocol_version;

	/**
	 * Supplied by the caller; only used for logging.
	 */
	std::string correlation_id;

	/**
	 * The opaque request payload, passed through to the broker
	 * implementation.
	 */
	std::string request_json;
};

} // namespace Broker
