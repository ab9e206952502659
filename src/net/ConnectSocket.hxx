// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <chrono>
#include <string_view>

class UniqueSocketDescriptor;

/**
 * Create a (blocking) local stream socket and connect it to the
 * given path.
 *
 * Throws on error.
 */
UniqueSocketDescriptor
CreateConnectLocalSocket(std::string_view path);

/**
 * Create a non-blocking local stream socket and connect it to the
 * given path, giving up after the given duration.  A listener whose
 * backlog is full is retried until then.
 *
 * Throws on error; on timeout, the std::system_error carries
 * ETIMEDOUT.
 */
UniqueSocketDescriptor
CreateConnectLocalSocketNonBlock(std::string_view path,
				 std::chrono::milliseconds timeout);
