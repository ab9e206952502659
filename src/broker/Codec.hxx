// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * The envelope codec of the broker socket.  A request is one JSON
 * object whose only key is the operation name and whose value is an
 * array of three strings:
 *
 *   {"<operation>":["<protocol_version>","<correlation_id>","<request_json>"]}
 *
 * There is no length prefix; a request is complete as soon as the
 * buffer parses.  Responses are the raw result string without any
 * framing.
 */

#pragma once

#include "Request.hxx"

#include <optional>
#include <string>
#include <string_view>

namespace Broker {

/**
 * Attempt to parse the given buffer as exactly one request.
 *
 * @return the request or std::nullopt if the buffer is not (yet) a
 * complete and valid request
 */
std::optional<Request>
ParseRequest(std::string_view src);

/**
 * Decode a request from the receive buffer.  On success, the whole
 * buffer is consumed (cleared).  On failure, nothing is consumed:
 * the caller is expected to append more data and try again.
 */
std::optional<Request>
DecodeRequest(std::string &buffer);

/**
 * Serialize a request envelope.
 */
std::string
EncodeRequest(Operation operation,
	      std::string_view protocol_version,
	      std::string_view correlation_id,
	      std::string_view request_json);

inline std::string
EncodeRequest(const Request &request)
{
	return EncodeRequest(request.operation, request.protocol_version,
			     request.correlation_id, request.request_json);
}

} // namespace Broker
