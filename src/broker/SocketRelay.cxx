// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SocketRelay.hxx"
#include "Codec.hxx"
#include "Error.hxx"
#include "net/ConnectSocket.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "net/SocketError.hxx"
#include "util/Exception.hxx"
#include "util/SpanCast.hxx"

#include <fmt/format.h>

#include <memory>
#include <system_error>
#include <thread>

namespace Broker {

/**
 * How long to wait after a zero-length read before trying again?
 */
static constexpr std::chrono::milliseconds EMPTY_READ_BACKOFF{10};

static std::chrono::milliseconds
GetRemaining(std::chrono::steady_clock::time_point deadline) noexcept
{
	const auto now = std::chrono::steady_clock::now();
	if (now >= deadline)
		return std::chrono::milliseconds::zero();

	return std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
}

/**
 * Send the whole request on the non-blocking socket.
 *
 * @return false if the deadline has passed before the request was
 * sent
 */
static bool
SendAll(SocketDescriptor s, std::string_view src,
	std::chrono::steady_clock::time_point deadline)
{
	auto data = AsBytes(src);

	while (!data.empty()) {
		const auto nbytes = s.Send(data);
		if (nbytes < 0) {
			const auto e = GetSocketError();
			if (IsSocketErrorInterruped(e))
				continue;

			if (!IsSocketErrorSendWouldBlock(e))
				throw MakeSocketError(e, "Failed to send request");

			const auto remaining = GetRemaining(deadline);
			if (remaining <= std::chrono::milliseconds::zero())
				return false;

			if (s.WaitWritable(int(remaining.count())) < 0 &&
			    !IsSocketErrorInterruped(GetSocketError()))
				throw MakeSocketError("Failed to send request");

			continue;
		}

		data = data.subspan(nbytes);
	}

	return true;
}

std::string
SocketRelay::Forward(Operation operation,
		     std::string_view protocol_version,
		     std::string_view correlation_id,
		     std::string_view request_json)
{
	logger.Fmt(4, "{} correlation_id={}", ToString(operation),
		   correlation_id);

	const auto deadline = std::chrono::steady_clock::now() + timeout;

	UniqueSocketDescriptor s;
	bool sent;

	try {
		s = CreateConnectLocalSocketNonBlock(path, timeout);
		sent = SendAll(s, EncodeRequest(operation, protocol_version,
						correlation_id, request_json),
			       deadline);
	} catch (const std::bad_alloc &) {
		throw;
	} catch (const std::system_error &e) {
		throw Error{e.code() == std::errc::timed_out
			    ? ErrorCode::TIMEOUT
			    : ErrorCode::FAILED,
			    GetFullMessage(std::current_exception())};
	} catch (...) {
		throw Error{ErrorCode::FAILED,
			    GetFullMessage(std::current_exception())};
	}

	if (!sent)
		throw Error{ErrorCode::TIMEOUT,
			    fmt::format("Sending the request to '{}' did not complete within {} ms",
					path, timeout.count())};

	std::string response;
	const auto buffer = std::make_unique<std::byte[]>(chunk_size);

	while (true) {
		const auto now = std::chrono::steady_clock::now();
		if (now >= deadline)
			throw Error{ErrorCode::TIMEOUT,
				    fmt::format("No response from '{}' within {} ms",
						path, timeout.count())};

		const auto remaining =
			std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
		const int ready = s.WaitReadable(int(remaining.count()));
		if (ready < 0) {
			if (IsSocketErrorInterruped(GetSocketError()))
				continue;

			throw Error{ErrorCode::FAILED,
				    MakeSocketError("Failed to wait for response").what()};
		}

		if (ready == 0)
			/* the deadline check above throws */
			continue;

		const auto nbytes = s.Receive({buffer.get(), chunk_size});
		if (nbytes < 0) {
			const auto e = GetSocketError();
			if (IsSocketErrorInterruped(e) ||
			    IsSocketErrorReceiveWouldBlock(e))
				continue;

			throw Error{ErrorCode::FAILED,
				    MakeSocketError(e, "Failed to receive response").what()};
		}

		if (nbytes == 0) {
			if (!response.empty())
				/* end of stream after a chunk-sized
				   response */
				break;

			std::this_thread::sleep_for(EMPTY_READ_BACKOFF);
			continue;
		}

		response.append(ToStringView(std::span{buffer.get(), std::size_t(nbytes)}));

		if (std::size_t(nbytes) < chunk_size)
			break;
	}

	return response;
}

} // namespace Broker
