// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "../ShutdownSignal.hxx"
#include "event/Loop.hxx"
#include "event/ShutdownListener.hxx"
#include "event/SocketEvent.hxx"
#include "io/Logger.hxx"

#include <forward_list>
#include <thread>

namespace Broker {

class BusService;

/**
 * The process-wide state of a broker-relay daemon: the event loop,
 * the #ShutdownSignal (fired by SIGTERM/SIGINT/SIGQUIT or by a
 * failing bus thread) and the bus threads.
 *
 * Construct this before any thread is started so all threads
 * inherit the blocked signal mask.
 */
class Instance {
	const LLogger logger{"instance"};

	EventLoop event_loop;

	ShutdownSignal shutdown_signal;

	ShutdownListener shutdown_listener;

	SocketEvent shutdown_event;

	std::forward_list<std::thread> threads;

public:
	/**
	 * Throws on error.
	 */
	Instance();

	/**
	 * Fires the #ShutdownSignal and joins all bus threads.
	 */
	~Instance() noexcept;

	Instance(const Instance &) = delete;
	Instance &operator=(const Instance &) = delete;

	EventLoop &GetEventLoop() noexcept {
		return event_loop;
	}

	const ShutdownSignal &GetShutdownSignal() const noexcept {
		return shutdown_signal;
	}

	/**
	 * Run BusService::Serve() in a new thread.  The #BusService
	 * must outlive this object.
	 */
	void Spawn(BusService &service);

	/**
	 * Run the event loop until the #ShutdownSignal fires and all
	 * of its subscribers have finished, then join all bus
	 * threads.
	 */
	void Run() noexcept;

private:
	void JoinThreads() noexcept;

	void OnSignal() noexcept;
	void OnShutdownSignal(unsigned events) noexcept;
};

} // namespace Broker
