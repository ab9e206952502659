// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <sys/socket.h>

/**
 * A portable wrapper for the credentials of a socket peer
 * (SO_PEERCRED).
 */
class SocketPeerCredentials {
	struct ucred cred;

public:
	static constexpr SocketPeerCredentials Undefined() noexcept {
		SocketPeerCredentials c;
		c.cred.pid = 0;
		c.cred.uid = -1;
		c.cred.gid = -1;
		return c;
	}

	constexpr bool IsDefined() const noexcept {
		return cred.pid > 0;
	}

	constexpr pid_t GetPid() const noexcept {
		return cred.pid;
	}

	constexpr uid_t GetUid() const noexcept {
		return cred.uid;
	}

	constexpr gid_t GetGid() const noexcept {
		return cred.gid;
	}

	friend class SocketDescriptor;
};
