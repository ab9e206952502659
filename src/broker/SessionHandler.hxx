// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Operation.hxx"

#include <string>
#include <string_view>

namespace Broker {

/**
 * The implementation behind the Session Broker bus interface.  It
 * has the same operations as #Handler, but without a uid: the
 * privileged side determines the caller itself.
 *
 * Errors are thrown as #Error.
 */
class SessionHandler {
public:
	virtual ~SessionHandler() noexcept = default;

	virtual std::string AcquireTokenInteractively(std::string_view protocol_version,
						      std::string_view correlation_id,
						      std::string_view request_json) = 0;

	virtual std::string AcquireTokenSilently(std::string_view protocol_version,
						 std::string_view correlation_id,
						 std::string_view request_json) = 0;

	virtual std::string GetAccounts(std::string_view protocol_version,
					std::string_view correlation_id,
					std::string_view request_json) = 0;

	virtual std::string RemoveAccount(std::string_view protocol_version,
					  std::string_view correlation_id,
					  std::string_view request_json) = 0;

	virtual std::string AcquirePrtSsoCookie(std::string_view protocol_version,
						std::string_view correlation_id,
						std::string_view request_json) = 0;

	virtual std::string GenerateSignedHttpRequest(std::string_view protocol_version,
						      std::string_view correlation_id,
						      std::string_view request_json) = 0;

	virtual std::string CancelInteractiveFlow(std::string_view protocol_version,
						  std::string_view correlation_id,
						  std::string_view request_json) = 0;

	virtual std::string GetLinuxBrokerVersion(std::string_view protocol_version,
						  std::string_view correlation_id,
						  std::string_view request_json) = 0;
};

std::string
Invoke(SessionHandler &handler, Operation operation,
       std::string_view protocol_version,
       std::string_view correlation_id,
       std::string_view request_json);

/**
 * A #SessionHandler which forwards every operation to one generic
 * method.  This is the base class of the relay clients.
 */
class ForwardingSessionHandler : public SessionHandler {
public:
	std::string AcquireTokenInteractively(std::string_view protocol_version,
					      std::string_view correlation_id,
					      std::string_view request_json) override {
		return Forward(Operation::ACQUIRE_TOKEN_INTERACTIVELY,
			       protocol_version, correlation_id, request_json);
	}

	std::string AcquireTokenSilently(std::string_view protocol_version,
					 std::string_view correlation_id,
					 std::string_view request_json) override {
		return Forward(Operation::ACQUIRE_TOKEN_SILENTLY,
			       protocol_version, correlation_id, request_json);
	}

	std::string GetAccounts(std::string_view protocol_version,
				std::string_view correlation_id,
				std::string_view request_json) override {
		return Forward(Operation::GET_ACCOUNTS,
			       protocol_version, correlation_id, request_json);
	}

	std::string RemoveAccount(std::string_view protocol_version,
				  std::string_view correlation_id,
				  std::string_view request_json) override {
		return Forward(Operation::REMOVE_ACCOUNT,
			       protocol_version, correlation_id, request_json);
	}

	std::string AcquirePrtSsoCookie(std::string_view protocol_version,
					std::string_view correlation_id,
					std::string_view request_json) override {
		return Forward(Operation::ACQUIRE_PRT_SSO_COOKIE,
			       protocol_version, correlation_id, request_json);
	}

	std::string GenerateSignedHttpRequest(std::string_view protocol_version,
					      std::string_view correlation_id,
					      std::string_view request_json) override {
		return Forward(Operation::GENERATE_SIGNED_HTTP_REQUEST,
			       protocol_version, correlation_id, request_json);
	}

	std::string CancelInteractiveFlow(std::string_view protocol_version,
					  std::string_view correlation_id,
					  std::string_view request_json) override {
		return Forward(Operation::CANCEL_INTERACTIVE_FLOW,
			       protocol_version, correlation_id, request_json);
	}

	std::string GetLinuxBrokerVersion(std::string_view protocol_version,
					  std::string_view correlation_id,
					  std::string_view request_json) override {
		return Forward(Operation::GET_LINUX_BROKER_VERSION,
			       protocol_version, correlation_id, request_json);
	}

protected:
	virtual std::string Forward(Operation operation,
				    std::string_view protocol_version,
				    std::string_view correlation_id,
				    std::string_view request_json) = 0;
};

} // namespace Broker
