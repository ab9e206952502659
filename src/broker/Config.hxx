// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <limits>
#include <string>

namespace Broker {

static constexpr const char *DEFAULT_SOCKET_PATH =
	"/var/run/himmelblaud/broker_sock";

static constexpr const char *DEFAULT_CONFIG_PATH =
	"/etc/himmelblau/broker-relay.conf";

struct ListenerConfig {
	std::string socket_path = DEFAULT_SOCKET_PATH;

	/**
	 * Connections whose pending input grows beyond this size
	 * without forming a request are closed.
	 */
	std::size_t max_request_size = 1024 * 1024;
};

struct SystemBusConfig {
	/**
	 * Export the System Broker on the system bus?
	 */
	bool enabled = true;

	/**
	 * Export the Device Capability Broker on the system bus?
	 */
	bool device_broker = true;
};

struct RelayConfig {
	enum class Mode {
		BUS,
		SOCKET,
	} mode = Mode::BUS;

	std::string socket_path = DEFAULT_SOCKET_PATH;

	/**
	 * Larger values are clamped to this; libdbus and poll() take
	 * the timeout as a signed int.
	 */
	static constexpr std::chrono::milliseconds MAX_TIMEOUT{std::numeric_limits<int>::max()};

	std::chrono::milliseconds timeout{5000};

	std::size_t chunk_size = 4096;
};

struct Config {
	ListenerConfig listener;
	SystemBusConfig system_bus;
	RelayConfig relay;
};

/**
 * Load the configuration file.  A missing file is not an error; the
 * defaults remain in effect.
 *
 * Throws on error.
 */
void
LoadConfigFile(Config &config, const std::filesystem::path &path);

} // namespace Broker
