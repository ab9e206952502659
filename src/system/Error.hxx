// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <system_error>

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.
 */
static inline const std::error_category &
ErrnoCategory() noexcept
{
	return std::system_category();
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code, ErrnoCategory()),
				 msg);
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

[[gnu::pure]]
inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}
