// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Operation.hxx"

#include <string>
#include <string_view>

#include <sys/types.h>

namespace Broker {

struct Request;

/**
 * The privileged identity broker implementation.  Each operation
 * receives the uid of the (already authenticated) caller and returns
 * the result string.
 *
 * Errors are thrown as #Error; other exceptions are reported to the
 * caller as #ErrorCode::FAILED.
 *
 * One instance is shared by all connections and bus threads, and
 * methods may be called concurrently.
 */
class Handler {
public:
	virtual ~Handler() noexcept = default;

	virtual std::string AcquireTokenInteractively(std::string_view protocol_version,
						      std::string_view correlation_id,
						      std::string_view request_json,
						      uid_t uid) = 0;

	virtual std::string AcquireTokenSilently(std::string_view protocol_version,
						 std::string_view correlation_id,
						 std::string_view request_json,
						 uid_t uid) = 0;

	virtual std::string GetAccounts(std::string_view protocol_version,
					std::string_view correlation_id,
					std::string_view request_json,
					uid_t uid) = 0;

	virtual std::string RemoveAccount(std::string_view protocol_version,
					  std::string_view correlation_id,
					  std::string_view request_json,
					  uid_t uid) = 0;

	virtual std::string AcquirePrtSsoCookie(std::string_view protocol_version,
						std::string_view correlation_id,
						std::string_view request_json,
						uid_t uid) = 0;

	virtual std::string GenerateSignedHttpRequest(std::string_view protocol_version,
						      std::string_view correlation_id,
						      std::string_view request_json,
						      uid_t uid) = 0;

	virtual std::string CancelInteractiveFlow(std::string_view protocol_version,
						  std::string_view correlation_id,
						  std::string_view request_json,
						  uid_t uid) = 0;

	virtual std::string GetLinuxBrokerVersion(std::string_view protocol_version,
						  std::string_view correlation_id,
						  std::string_view request_json,
						  uid_t uid) = 0;
};

/**
 * Call the #Handler method which implements the given operation.
 */
std::string
Invoke(Handler &handler, Operation operation,
       std::string_view protocol_version,
       std::string_view correlation_id,
       std::string_view request_json,
       uid_t uid);

std::string
Invoke(Handler &handler, const Request &request, uid_t uid);

} // namespace Broker
