// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "LocalSocketAddress.hxx"

#include <cstddef>
#include <cstring>
#include <stdexcept>

LocalSocketAddress::LocalSocketAddress(std::string_view path)
{
	if (path.size() >= sizeof(address.sun_path))
		throw std::length_error{"Local socket path is too long"};

	address.sun_family = AF_LOCAL;
	std::memcpy(address.sun_path, path.data(), path.size());
	address.sun_path[path.size()] = 0;

	size = offsetof(struct sockaddr_un, sun_path) + path.size() + 1;

	if (!path.empty() && path.front() == '@') {
		/* abstract socket: no null terminator */
		address.sun_path[0] = 0;
		--size;
	}
}
