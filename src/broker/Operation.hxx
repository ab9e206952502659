// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace Broker {

/**
 * The identity broker operations which are available on the socket
 * and on the System/Session Broker bus interfaces.  All of them take
 * the same three string parameters.
 */
enum class Operation : uint_least8_t {
	ACQUIRE_TOKEN_INTERACTIVELY,
	ACQUIRE_TOKEN_SILENTLY,
	GET_ACCOUNTS,
	REMOVE_ACCOUNT,
	ACQUIRE_PRT_SSO_COOKIE,
	GENERATE_SIGNED_HTTP_REQUEST,
	CANCEL_INTERACTIVE_FLOW,
	GET_LINUX_BROKER_VERSION,
};

static constexpr std::array all_operations{
	Operation::ACQUIRE_TOKEN_INTERACTIVELY,
	Operation::ACQUIRE_TOKEN_SILENTLY,
	Operation::GET_ACCOUNTS,
	Operation::REMOVE_ACCOUNT,
	Operation::ACQUIRE_PRT_SSO_COOKIE,
	Operation::GENERATE_SIGNED_HTTP_REQUEST,
	Operation::CANCEL_INTERACTIVE_FLOW,
	Operation::GET_LINUX_BROKER_VERSION,
};

/**
 * Returns the name used on the wire (JSON key and D-Bus method
 * name).
 */
[[gnu::const]]
const char *
ToString(Operation operation) noexcept;

[[gnu::pure]]
std::optional<Operation>
ParseOperation(std::string_view name) noexcept;

} // namespace Broker
