// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * The privileged broker-relay daemon: serves the broker socket and
 * exports the System Broker and the Device Capability Broker on the
 * system bus.
 */

#include "CommandLine.hxx"
#include "Instance.hxx"
#include "../BusNames.hxx"
#include "../BusService.hxx"
#include "../Config.hxx"
#include "../Credentials.hxx"
#include "../DeviceBrokerObject.hxx"
#include "../Listener.hxx"
#include "../SystemBrokerObject.hxx"
#include "../UnavailableHandler.hxx"
#include "lib/dbus/Connection.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <new>
#include <optional>

#include <stdlib.h>

using namespace Broker;

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);
	SetLogLevel(cmdline.verbose);

	Config config;
	LoadConfigFile(config, cmdline.config_path);

	if (!dbus_threads_init_default())
		throw std::bad_alloc{};

	const auto handler =
		std::make_shared<UnavailableHandler>(BROKER_RELAY_VERSION);

	std::optional<BusSenderUidLookup> uid_lookup;
	std::optional<SystemBrokerObject> system_object;
	std::optional<BusService> system_service;

	std::optional<DeviceBrokerObject> device_object;
	std::optional<BusService> device_service;

	if (config.system_bus.enabled) {
		auto connection = ODBus::Connection::GetSystemPrivate();
		uid_lookup.emplace(connection);
		system_object.emplace(handler, *uid_lookup);
		system_service.emplace(std::move(connection),
				       SystemBroker::NAME, SystemBroker::PATH,
				       *system_object);
	}

	if (config.system_bus.device_broker) {
		device_object.emplace(std::make_shared<UnavailableDeviceHandler>());
		device_service.emplace(ODBus::Connection::GetSystemPrivate(),
				       DeviceBroker::NAME, DeviceBroker::PATH,
				       *device_object);
	}

	Instance instance;

	Listener listener{instance.GetEventLoop(), handler,
		instance.GetShutdownSignal(),
		config.listener.max_request_size};
	listener.ListenPath(config.listener.socket_path.c_str());

	LogFmt(2, "broker-relay", "listening on {}",
	       config.listener.socket_path);

	if (system_service)
		instance.Spawn(*system_service);

	if (device_service)
		instance.Spawn(*device_service);

	instance.Run();

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
