// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * The per-user broker-relay daemon: exports the Session Broker on
 * the session bus and relays all calls to the privileged daemon.
 */

#include "CommandLine.hxx"
#include "Instance.hxx"
#include "../BusNames.hxx"
#include "../BusRelay.hxx"
#include "../BusService.hxx"
#include "../Config.hxx"
#include "../SessionBrokerObject.hxx"
#include "../SocketRelay.hxx"
#include "lib/dbus/Connection.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <memory>

#include <stdlib.h>

using namespace Broker;

static std::unique_ptr<SessionHandler>
MakeRelay(const RelayConfig &config)
{
	if (config.mode == RelayConfig::Mode::SOCKET)
		return std::make_unique<SocketRelay>(config.socket_path,
						     config.timeout,
						     config.chunk_size);

	return std::make_unique<BusRelay>(config.timeout);
}

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);
	SetLogLevel(cmdline.verbose);

	Config config;
	LoadConfigFile(config, cmdline.config_path);

	if (!dbus_threads_init_default())
		throw std::bad_alloc{};

	const auto relay = MakeRelay(config.relay);
	SessionBrokerObject object{*relay};
	BusService service{ODBus::Connection::GetSessionPrivate(),
		SessionBroker::NAME, SessionBroker::PATH,
		object};

	Instance instance;
	instance.Spawn(service);
	instance.Run();

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
