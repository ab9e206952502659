// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "SessionHandler.hxx"
#include "io/Logger.hxx"

#include <chrono>
#include <cstddef>
#include <string>

namespace Broker {

/**
 * Relays Session Broker calls to the broker socket of the privileged
 * daemon.  Each call uses a new connection; the privileged side
 * identifies the caller by its socket credentials.
 *
 * The response has no framing.  It is read in chunks of a fixed
 * size, and a chunk shorter than that size ends the response.  A
 * response whose length is a multiple of the chunk size is therefore
 * only completed by end-of-stream or by the timeout.
 */
class SocketRelay final : public ForwardingSessionHandler {
	const LLogger logger{"socket-relay"};

	const std::string path;

	const std::chrono::milliseconds timeout;

	const std::size_t chunk_size;

public:
	static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};
	static constexpr std::size_t DEFAULT_CHUNK_SIZE = 4096;

	explicit SocketRelay(std::string _path,
			     std::chrono::milliseconds _timeout=DEFAULT_TIMEOUT,
			     std::size_t _chunk_size=DEFAULT_CHUNK_SIZE) noexcept
		:path(std::move(_path)),
		 timeout(_timeout), chunk_size(_chunk_size) {}

protected:
	std::string Forward(Operation operation,
			    std::string_view protocol_version,
			    std::string_view correlation_id,
			    std::string_view request_json) override;
};

} // namespace Broker
