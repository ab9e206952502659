// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "DeviceHandler.hxx"
#include "Error.hxx"

namespace Broker {

const char *
ToString(DeviceOperation operation) noexcept
{
	switch (operation) {
	case DeviceOperation::SIGN:
		return "sign";

	case DeviceOperation::GENERATE_KEY_PAIR:
		return "generateKeyPair";

	case DeviceOperation::LOAD_KEY_PAIR:
		return "loadKeyPair";

	case DeviceOperation::PERSIST_KEY:
		return "persistKey";

	case DeviceOperation::GENERATE_DERIVED_KEY:
		return "generateDerivedKey";

	case DeviceOperation::DELETE_KEY:
		return "deleteKey";

	case DeviceOperation::DECRYPT:
		return "decrypt";

	case DeviceOperation::GENERATE_PKCS10_CERT_SIGNING_REQUEST:
		return "generatePKCS10CertSigningRequest";

	case DeviceOperation::ASYMMETRIC_KEY_EXISTS:
		return "asymmetricKeyExists";

	case DeviceOperation::ASYMMETRIC_KEY_WITH_THUMBPRINT_EXISTS:
		return "asymmetricKeyWithThumbprintExists";

	case DeviceOperation::GET_ASYMMETRIC_KEY_THUMBPRINT:
		return "getAsymmetricKeyThumbprint";

	case DeviceOperation::GENERATE_ASYMMETRIC_KEY:
		return "generateAsymmetricKey";

	case DeviceOperation::GET_ASYMMETRIC_KEY_CREATION_DATE:
		return "getAsymmetricKeyCreationDate";

	case DeviceOperation::CLEAR_ASYMMETRIC_KEY:
		return "clearAsymmetricKey";

	case DeviceOperation::GET_REQUEST_CONFIRMATION:
		return "getRequestConfirmation";

	case DeviceOperation::MINT_SIGNED_ACCESS_TOKEN:
		return "mintSignedAccessToken";

	case DeviceOperation::MINT_SIGNED_HTTP_REQUEST:
		return "mintSignedHttpRequest";

	case DeviceOperation::MAKE_HTTP_REQUEST_WITH_CLIENT_TLS:
		return "makeHttpRequestWithClientTls";
	}

	return "unknown";
}

std::optional<DeviceOperation>
ParseDeviceOperation(std::string_view name) noexcept
{
	for (const auto i : all_device_operations)
		if (name == ToString(i))
			return i;

	return std::nullopt;
}

std::string
Invoke(DeviceHandler &handler, DeviceOperation operation,
       std::string_view session_id, std::string_view request_json)
{
	switch (operation) {
	case DeviceOperation::SIGN:
		return handler.Sign(session_id, request_json);

	case DeviceOperation::GENERATE_KEY_PAIR:
		return handler.GenerateKeyPair(session_id, request_json);

	case DeviceOperation::LOAD_KEY_PAIR:
		return handler.LoadKeyPair(session_id, request_json);

	case DeviceOperation::PERSIST_KEY:
		return handler.PersistKey(session_id, request_json);

	case DeviceOperation::GENERATE_DERIVED_KEY:
		return handler.GenerateDerivedKey(session_id, request_json);

	case DeviceOperation::DELETE_KEY:
		return handler.DeleteKey(session_id, request_json);

	case DeviceOperation::DECRYPT:
		return handler.Decrypt(session_id, request_json);

	case DeviceOperation::GENERATE_PKCS10_CERT_SIGNING_REQUEST:
		return handler.GeneratePkcs10CertSigningRequest(session_id, request_json);

	case DeviceOperation::ASYMMETRIC_KEY_EXISTS:
		return handler.AsymmetricKeyExists(session_id, request_json);

	case DeviceOperation::ASYMMETRIC_KEY_WITH_THUMBPRINT_EXISTS:
		return handler.AsymmetricKeyWithThumbprintExists(session_id, request_json);

	case DeviceOperation::GET_ASYMMETRIC_KEY_THUMBPRINT:
		return handler.GetAsymmetricKeyThumbprint(session_id, request_json);

	case DeviceOperation::GENERATE_ASYMMETRIC_KEY:
		return handler.GenerateAsymmetricKey(session_id, request_json);

	case DeviceOperation::GET_ASYMMETRIC_KEY_CREATION_DATE:
		return handler.GetAsymmetricKeyCreationDate(session_id, request_json);

	case DeviceOperation::CLEAR_ASYMMETRIC_KEY:
		return handler.ClearAsymmetricKey(session_id, request_json);

	case DeviceOperation::GET_REQUEST_CONFIRMATION:
		return handler.GetRequestConfirmation(session_id, request_json);

	case DeviceOperation::MINT_SIGNED_ACCESS_TOKEN:
		return handler.MintSignedAccessToken(session_id, request_json);

	case DeviceOperation::MINT_SIGNED_HTTP_REQUEST:
		return handler.MintSignedHttpRequest(session_id, request_json);

	case DeviceOperation::MAKE_HTTP_REQUEST_WITH_CLIENT_TLS:
		return handler.MakeHttpRequestWithClientTls(session_id, request_json);
	}

	throw Error{ErrorCode::NOT_SUPPORTED, "Unknown operation"};
}

} // namespace Broker
