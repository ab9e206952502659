// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "system/Error.hxx"

#include <cerrno>

using socket_error_t = int;

[[gnu::pure]]
static inline socket_error_t
GetSocketError() noexcept
{
	return errno;
}

constexpr bool
IsSocketErrorAcceptWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

constexpr bool
IsSocketErrorReceiveWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

constexpr bool
IsSocketErrorSendWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

constexpr bool
IsSocketErrorInterruped(socket_error_t code) noexcept
{
	return code == EINTR;
}

constexpr bool
IsSocketErrorClosed(socket_error_t code) noexcept
{
	return code == EPIPE || code == ECONNRESET;
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeSocketError(socket_error_t code, const char *msg) noexcept
{
	return MakeErrno(code, msg);
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeSocketError(const char *msg) noexcept
{
	return MakeSocketError(GetSocketError(), msg);
}
