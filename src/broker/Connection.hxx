// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "event/SocketEvent.hxx"
#include "thread/Notify.hxx"
#include "io/Logger.hxx"
#include "util/IntrusiveList.hxx"

#include <exception>
#include <string>
#include <thread>

#include <sys/types.h>

class UniqueSocketDescriptor;

namespace Broker {

class Listener;
struct Request;

/**
 * One client connection on the broker socket.  It reads requests,
 * passes them to the #Handler and writes the responses; requests are
 * handled strictly one after another.  The #Handler runs on a worker
 * thread, so a slow request does not stall other connections.
 *
 * The object deletes itself when the connection is closed.
 */
class Connection final : public AutoUnlinkIntrusiveListHook {
	Listener &listener;

	const ChildLogger logger;

	SocketEvent event;

	/**
	 * The uid of the peer process, determined once when the
	 * connection was accepted.
	 */
	const uid_t uid;

	/**
	 * Received bytes which do not (yet) form a complete request.
	 */
	std::string input;

	/**
	 * The response which is currently being sent.
	 */
	std::string output;
	std::size_t output_position = 0;

	/**
	 * Runs the #Handler for the current request.  While it is
	 * joinable, #output and #worker_error belong to the worker.
	 */
	std::thread worker;

	std::exception_ptr worker_error;

	/**
	 * Wakes up the #EventLoop when the #worker has finished.
	 */
	Notify notify;

public:
	/**
	 * Throws on error.
	 */
	Connection(Listener &_listener,
		   UniqueSocketDescriptor fd, uid_t _uid);
	~Connection() noexcept;

	Connection(const Connection &) = delete;
	Connection &operator=(const Connection &) = delete;

	uid_t GetUid() const noexcept {
		return uid;
	}

	/**
	 * Is a request being handled or its response being sent?
	 */
	bool IsBusy() const noexcept {
		return worker.joinable() || event.IsWritePending();
	}

private:
	void Destroy() noexcept {
		delete this;
	}

	void OnError(std::exception_ptr ep) noexcept;

	void TryRead();
	void Dispatch(const Request &request);
	void TryWrite();

	void RunHandler(Request request) noexcept;
	void OnHandlerDone() noexcept;

	void OnSocketReady(unsigned events) noexcept;
};

} // namespace Broker
