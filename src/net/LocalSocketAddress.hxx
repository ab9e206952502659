// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "SocketAddress.hxx"

#include <sys/un.h>

/**
 * An OO wrapper for struct sockaddr_un.
 */
class LocalSocketAddress {
	socklen_t size;
	struct sockaddr_un address;

public:
	/**
	 * @param path the socket path; a leading '@' selects the
	 * abstract namespace
	 *
	 * Throws std::length_error if the path is too long.
	 */
	explicit LocalSocketAddress(std::string_view path);

	operator SocketAddress() const noexcept {
		return SocketAddress((const struct sockaddr *)&address, size);
	}
};
