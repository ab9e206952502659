// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Operation.hxx"

namespace Broker {

const char *
ToString(Operation operation) noexcept
{
	switch (operation) {
	case Operation::ACQUIRE_TOKEN_INTERACTIVELY:
		return "acquireTokenInteractively";

	case Operation::ACQUIRE_TOKEN_SILENTLY:
		return "acquireTokenSilently";

	case Operation::GET_ACCOUNTS:
		return "getAccounts";

	case Operation::REMOVE_ACCOUNT:
		return "removeAccount";

	case Operation::ACQUIRE_PRT_SSO_COOKIE:
		return "acquirePrtSsoCookie";

	case Operation::GENERATE_SIGNED_HTTP_REQUEST:
		return "generateSignedHttpRequest";

	case Operation::CANCEL_INTERACTIVE_FLOW:
		return "cancelInteractiveFlow";

	case Operation::GET_LINUX_BROKER_VERSION:
		return "getLinuxBrokerVersion";
	}

	return "unknown";
}

std::optional<Operation>
ParseOperation(std::string_view name) noexcept
{
	for (const auto i : all_operations)
		if (name == ToString(i))
			return i;

	return std::nullopt;
}

} // namespace Broker
