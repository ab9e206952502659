// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Handler.hxx"
#include "DeviceHandler.hxx"

#include <string>
#include <utility>

namespace Broker {

/**
 * A #Handler which declines everything with
 * #ErrorCode::NOT_SUPPORTED.  Only getLinuxBrokerVersion is
 * answered.  The system daemon uses this until a real identity
 * provider is linked in.
 */
class UnavailableHandler final : public Handler {
	const std::string version;

public:
	explicit UnavailableHandler(std::string _version) noexcept
		:version(std::move(_version)) {}

	std::string AcquireTokenInteractively(std::string_view protocol_version,
			std::string_view correlation_id,
			std::string_view request_json,
			uid_t uid) override;

	std::string AcquireTokenSilently(std::string_view protocol_version,
			std::string_view correlation_id,
			std::string_view request_json,
			uid_t uid) override;

	std::string GetAccounts(std::string_view protocol_version,
			std::string_view correlation_id,
			std::string_view request_json,
			uid_t uid) override;

	std::string RemoveAccount(std::string_view protocol_version,
			std::string_view correlation_id,
			std::string_view request_json,
			uid_t uid) override;

	std::string AcquirePrtSsoCookie(std::string_view protocol_version,
			std::string_view correlation_id,
			std::string_view request_json,
			uid_t uid) override;

	std::string GenerateSignedHttpRequest(std::string_view protocol_version,
			std::string_view correlation_id,
			std::string_view request_json,
			uid_t uid) override;

	std::string CancelInteractiveFlow(std::string_view protocol_version,
			std::string_view correlation_id,
			std::string_view request_json,
			uid_t uid) override;

	std::string GetLinuxBrokerVersion(std::string_view protocol_version,
					  std::string_view correlation_id,
					  std::string_view request_json,
					  uid_t uid) override;
};

/**
 * A #DeviceHandler which declines everything with
 * #ErrorCode::NOT_SUPPORTED.
 */
class UnavailableDeviceHandler final : public DeviceHandler {
public:
	std::string Sign(std::string_view session_id,
			std::string_view request_json) override;
	std::string GenerateKeyPair(std::string_view session_id,
			std::string_view request_json) override;
	std::string LoadKeyPair(std::string_view session_id,
			std::string_view request_json) override;
	std::string PersistKey(std::string_view session_id,
			std::string_view request_json) override;
	std::string GenerateDerivedKey(std::string_view session_id,
			std::string_view request_json) override;
	std::string DeleteKey(std::string_view session_id,
			std::string_view request_json) override;
	std::string Decrypt(std::string_view session_id,
			std::string_view request_json) override;
	std::string GeneratePkcs10CertSigningRequest(std::string_view session_id,
			std::string_view request_json) override;
	std::string AsymmetricKeyExists(std::string_view session_id,
			std::string_view request_json) override;
	std::string AsymmetricKeyWithThumbprintExists(std::string_view session_id,
			std::string_view request_json) override;
	std::string GetAsymmetricKeyThumbprint(std::string_view session_id,
			std::string_view request_json) override;
	std::string GenerateAsymmetricKey(std::string_view session_id,
			std::string_view request_json) override;
	std::string GetAsymmetricKeyCreationDate(std::string_view session_id,
			std::string_view request_json) override;
	std::string ClearAsymmetricKey(std::string_view session_id,
			std::string_view request_json) override;
	std::string GetRequestConfirmation(std::string_view session_id,
			std::string_view request_json) override;
	std::string MintSignedAccessToken(std::string_view session_id,
			std::string_view request_json) override;
	std::string MintSignedHttpRequest(std::string_view session_id,
			std::string_view request_json) override;
	std::string MakeHttpRequestWithClientTls(std::string_view session_id,
			std::string_view request_json) override;
};

} // namespace Broker
