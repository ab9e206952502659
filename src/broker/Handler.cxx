// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Handler.hxx"
#include "Request.hxx"
#include "Error.hxx"

namespace Broker {

std::string
Invoke(Handler &handler, Operation operation,
       std::string_view protocol_version,
       std::string_view correlation_id,
       std::string_view request_json,
       uid_t uid)
{
	switch (operation) {
	case Operation::ACQUIRE_TOKEN_INTERACTIVELY:
		return handler.AcquireTokenInteractively(protocol_version,
							 correlation_id,
							 request_json, uid);

	case Operation::ACQUIRE_TOKEN_SILENTLY:
		return handler.AcquireTokenSilently(protocol_version,
						    correlation_id,
						    request_json, uid);

	case Operation::GET_ACCOUNTS:
		return handler.GetAccounts(protocol_version, correlation_id,
					   request_json, uid);

	case Operation::REMOVE_ACCOUNT:
		return handler.RemoveAccount(protocol_version, correlation_id,
					     request_json, uid);

	case Operation::ACQUIRE_PRT_SSO_COOKIE:
		return handler.AcquirePrtSsoCookie(protocol_version,
						   correlation_id,
						   request_json, uid);

	case Operation::GENERATE_SIGNED_HTTP_REQUEST:
		return handler.GenerateSignedHttpRequest(protocol_version,
							 correlation_id,
							 request_json, uid);

	case Operation::CANCEL_INTERACTIVE_FLOW:
		return handler.CancelInteractiveFlow(protocol_version,
						     correlation_id,
						     request_json, uid);

	case Operation::GET_LINUX_BROKER_VERSION:
		return handler.GetLinuxBrokerVersion(protocol_version,
						     correlation_id,
						     request_json, uid);
	}

	throw Error{ErrorCode::NOT_SUPPORTED, "Unknown operation"};
}

std::string
Invoke(Handler &handler, const Request &request, uid_t uid)
{
	return Invoke(handler, request.operation,
		      request.protocol_version, request.correlation_id,
		      request.request_json, uid);
}

} // namespace Broker
