// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SocketAddress.hxx"

#include <cstddef>

#include <sys/un.h>

const char *
SocketAddress::GetLocalPath() const noexcept
{
	if (IsNull() || GetFamily() != AF_LOCAL)
		return nullptr;

	const auto *sun = reinterpret_cast<const struct sockaddr_un *>(GetAddress());
	const std::size_t path_length = GetSize() - offsetof(struct sockaddr_un, sun_path);
	if (path_length < 2 || sun->sun_path[0] == 0)
		/* unnamed or abstract socket */
		return nullptr;

	return sun->sun_path;
}
