// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace Broker {

enum class ErrorCode : uint_least8_t {
	/**
	 * Generic failure of the broker implementation or of a
	 * transport.
	 */
	FAILED,

	/**
	 * The caller could not be identified, or the implementation
	 * declined the request.
	 */
	ACCESS_DENIED,

	TIMEOUT,

	NOT_SUPPORTED,

	INVALID_ARGS,
};

/**
 * The failure vocabulary of the broker interfaces.  Everything that
 * goes wrong while handling a call is eventually reported as one of
 * these.
 */
class Error : public std::runtime_error {
	ErrorCode code;

public:
	Error(ErrorCode _code, const char *_msg)
		:std::runtime_error(_msg), code(_code) {}

	Error(ErrorCode _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	ErrorCode GetCode() const noexcept {
		return code;
	}
};

/**
 * Returns the D-Bus error name which represents the given code.
 */
[[gnu::const]]
const char *
ToDBusErrorName(ErrorCode code) noexcept;

/**
 * The reverse of ToDBusErrorName().  Unknown names are mapped to
 * #ErrorCode::FAILED.
 */
[[gnu::pure]]
ErrorCode
ErrorCodeFromDBusName(const char *name) noexcept;

/**
 * Convert an arbitrary exception to a #Error.  Instances of #Error
 * are copied, everything else becomes #ErrorCode::FAILED with the
 * full (nested) message.
 */
Error
ToError(std::exception_ptr ep) noexcept;

} // namespace Broker
