// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "UnavailableHandler.hxx"
#include "Error.hxx"

#include <nlohmann/json.hpp>

#include <fmt/format.h>

namespace Broker {

[[noreturn]]
static void
ThrowNotSupported(const char *operation)
{
	throw Error{ErrorCode::NOT_SUPPORTED,
		    fmt::format("{} is not supported by this broker",
				operation)};
}

std::string
UnavailableHandler::AcquireTokenInteractively(std::string_view, std::string_view,
				std::string_view, uid_t)
{
	ThrowNotSupported(ToString(Operation::ACQUIRE_TOKEN_INTERACTIVELY));
}

std::string
UnavailableHandler::AcquireTokenSilently(std::string_view, std::string_view,
				std::string_view, uid_t)
{
	ThrowNotSupported(ToString(Operation::ACQUIRE_TOKEN_SILENTLY));
}

std::string
UnavailableHandler::GetAccounts(std::string_view, std::string_view,
				std::string_view, uid_t)
{
	ThrowNotSupported(ToString(Operation::GET_ACCOUNTS));
}

std::string
UnavailableHandler::RemoveAccount(std::string_view, std::string_view,
				std::string_view, uid_t)
{
	ThrowNotSupported(ToString(Operation::REMOVE_ACCOUNT));
}

std::string
UnavailableHandler::AcquirePrtSsoCookie(std::string_view, std::string_view,
				std::string_view, uid_t)
{
	ThrowNotSupported(ToString(Operation::ACQUIRE_PRT_SSO_COOKIE));
}

std::string
UnavailableHandler::GenerateSignedHttpRequest(std::string_view, std::string_view,
				std::string_view, uid_t)
{
	ThrowNotSupported(ToString(Operation::GENERATE_SIGNED_HTTP_REQUEST));
}

std::string
UnavailableHandler::CancelInteractiveFlow(std::string_view, std::string_view,
				std::string_view, uid_t)
{
	ThrowNotSupported(ToString(Operation::CANCEL_INTERACTIVE_FLOW));
}

std::string
UnavailableHandler::GetLinuxBrokerVersion(std::string_view, std::string_view,
					  std::string_view, uid_t)
{
	nlohmann::json j;
	j["linuxBrokerVersion"] = version;
	return j.dump();
}

std::string
UnavailableDeviceHandler::Sign(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::SIGN));
}

std::string
UnavailableDeviceHandler::GenerateKeyPair(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::GENERATE_KEY_PAIR));
}

std::string
UnavailableDeviceHandler::LoadKeyPair(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::LOAD_KEY_PAIR));
}

std::string
UnavailableDeviceHandler::PersistKey(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::PERSIST_KEY));
}

std::string
UnavailableDeviceHandler::GenerateDerivedKey(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::GENERATE_DERIVED_KEY));
}

std::string
UnavailableDeviceHandler::DeleteKey(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::DELETE_KEY));
}

std::string
UnavailableDeviceHandler::Decrypt(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::DECRYPT));
}

std::string
UnavailableDeviceHandler::GeneratePkcs10CertSigningRequest(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::GENERATE_PKCS10_CERT_SIGNING_REQUEST));
}

std::string
UnavailableDeviceHandler::AsymmetricKeyExists(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::ASYMMETRIC_KEY_EXISTS));
}

std::string
UnavailableDeviceHandler::AsymmetricKeyWithThumbprintExists(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::ASYMMETRIC_KEY_WITH_THUMBPRINT_EXISTS));
}

std::string
UnavailableDeviceHandler::GetAsymmetricKeyThumbprint(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::GET_ASYMMETRIC_KEY_THUMBPRINT));
}

std::string
UnavailableDeviceHandler::GenerateAsymmetricKey(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::GENERATE_ASYMMETRIC_KEY));
}

std::string
UnavailableDeviceHandler::GetAsymmetricKeyCreationDate(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::GET_ASYMMETRIC_KEY_CREATION_DATE));
}

std::string
UnavailableDeviceHandler::ClearAsymmetricKey(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::CLEAR_ASYMMETRIC_KEY));
}

std::string
UnavailableDeviceHandler::GetRequestConfirmation(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::GET_REQUEST_CONFIRMATION));
}

std::string
UnavailableDeviceHandler::MintSignedAccessToken(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::MINT_SIGNED_ACCESS_TOKEN));
}

std::string
UnavailableDeviceHandler::MintSignedHttpRequest(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::MINT_SIGNED_HTTP_REQUEST));
}

std::string
UnavailableDeviceHandler::MakeHttpRequestWithClientTls(std::string_view, std::string_view)
{
	ThrowNotSupported(ToString(DeviceOperation::MAKE_HTTP_REQUEST_WITH_CLIENT_TLS));
}

} // namespace Broker
