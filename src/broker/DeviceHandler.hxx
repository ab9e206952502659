// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Broker {

/**
 * The key management operations of the Device Capability Broker.
 * All of them take a session id and a request payload.
 */
enum class DeviceOperation : uint_least8_t {
	SIGN,
	GENERATE_KEY_PAIR,
	LOAD_KEY_PAIR,
	PERSIST_KEY,
	GENERATE_DERIVED_KEY,
	DELETE_KEY,
	DECRYPT,
	GENERATE_PKCS10_CERT_SIGNING_REQUEST,
	ASYMMETRIC_KEY_EXISTS,
	ASYMMETRIC_KEY_WITH_THUMBPRINT_EXISTS,
	GET_ASYMMETRIC_KEY_THUMBPRINT,
	GENERATE_ASYMMETRIC_KEY,
	GET_ASYMMETRIC_KEY_CREATION_DATE,
	CLEAR_ASYMMETRIC_KEY,
	GET_REQUEST_CONFIRMATION,
	MINT_SIGNED_ACCESS_TOKEN,
	MINT_SIGNED_HTTP_REQUEST,
	MAKE_HTTP_REQUEST_WITH_CLIENT_TLS,
};

static constexpr std::array all_device_operations{
	DeviceOperation::SIGN,
	DeviceOperation::GENERATE_KEY_PAIR,
	DeviceOperation::LOAD_KEY_PAIR,
	DeviceOperation::PERSIST_KEY,
	DeviceOperation::GENERATE_DERIVED_KEY,
	DeviceOperation::DELETE_KEY,
	DeviceOperation::DECRYPT,
	DeviceOperation::GENERATE_PKCS10_CERT_SIGNING_REQUEST,
	DeviceOperation::ASYMMETRIC_KEY_EXISTS,
	DeviceOperation::ASYMMETRIC_KEY_WITH_THUMBPRINT_EXISTS,
	DeviceOperation::GET_ASYMMETRIC_KEY_THUMBPRINT,
	DeviceOperation::GENERATE_ASYMMETRIC_KEY,
	DeviceOperation::GET_ASYMMETRIC_KEY_CREATION_DATE,
	DeviceOperation::CLEAR_ASYMMETRIC_KEY,
	DeviceOperation::GET_REQUEST_CONFIRMATION,
	DeviceOperation::MINT_SIGNED_ACCESS_TOKEN,
	DeviceOperation::MINT_SIGNED_HTTP_REQUEST,
	DeviceOperation::MAKE_HTTP_REQUEST_WITH_CLIENT_TLS,
};

/**
 * Returns the D-Bus method name.
 */
[[gnu::const]]
const char *
ToString(DeviceOperation operation) noexcept;

[[gnu::pure]]
std::optional<DeviceOperation>
ParseDeviceOperation(std::string_view name) noexcept;

/**
 * The device key management implementation.  The session id is
 * opaque to the bus layer; authorizing the caller with it is up to
 * the implementation.
 *
 * Errors are thrown as #Error.
 */
class DeviceHandler {
public:
	virtual ~DeviceHandler() noexcept = default;

	virtual std::string Sign(std::string_view session_id,
				 std::string_view request_json) = 0;
	virtual std::string GenerateKeyPair(std::string_view session_id,
					    std::string_view request_json) = 0;
	virtual std::string LoadKeyPair(std::string_view session_id,
					std::string_view request_json) = 0;
	virtual std::string PersistKey(std::string_view session_id,
				       std::string_view request_json) = 0;
	virtual std::string GenerateDerivedKey(std::string_view session_id,
					       std::string_view request_json) = 0;
	virtual std::string DeleteKey(std::string_view session_id,
				      std::string_view request_json) = 0;
	virtual std::string Decrypt(std::string_view session_id,
				    std::string_view request_json) = 0;
	virtual std::string GeneratePkcs10CertSigningRequest(std::string_view session_id,
							     std::string_view request_json) = 0;
	virtual std::string AsymmetricKeyExists(std::string_view session_id,
						std::string_view request_json) = 0;
	virtual std::string AsymmetricKeyWithThumbprintExists(std::string_view session_id,
							      std::string_view request_json) = 0;
	virtual std::string GetAsymmetricKeyThumbprint(std::string_view session_id,
						       std::string_view request_json) = 0;
	virtual std::string GenerateAsymmetricKey(std::string_view session_id,
						  std::string_view request_json) = 0;
	virtual std::string GetAsymmetricKeyCreationDate(std::string_view session_id,
							 std::string_view request_json) = 0;
	virtual std::string ClearAsymmetricKey(std::string_view session_id,
					       std::string_view request_json) = 0;
	virtual std::string GetRequestConfirmation(std::string_view session_id,
						   std::string_view request_json) = 0;
	virtual std::string MintSignedAccessToken(std::string_view session_id,
						  std::string_view request_json) = 0;
	virtual std::string MintSignedHttpRequest(std::string_view session_id,
						  std::string_view request_json) = 0;
	virtual std::string MakeHttpRequestWithClientTls(std::string_view session_id,
							 std::string_view request_json) = 0;
};

std::string
Invoke(DeviceHandler &handler, DeviceOperation operation,
       std::string_view session_id, std::string_view request_json);

} // namespace Broker
