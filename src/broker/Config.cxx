// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "io/config/IniParser.hxx"
#include "io/config/FileLineParser.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <string_view>

#include <string.h>

using std::string_view_literals::operator""sv;

namespace Broker {

[[noreturn]]
static void
ThrowUnknownProperty(std::string_view name)
{
	throw LineParser::Error{fmt::format("Unknown property '{}'", name)};
}

class ListenerSectionParser final : public IniSectionParser {
	ListenerConfig &config;

public:
	explicit ListenerSectionParser(ListenerConfig &_config) noexcept
		:config(_config) {}

	void Property(std::string_view name, FileLineParser &line) override {
		if (name == "socket"sv)
			config.socket_path = line.ExpectPathAndEnd().native();
		else if (name == "max_request"sv)
			config.max_request_size = line.ExpectPositiveIntegerAndEnd();
		else
			ThrowUnknownProperty(name);
	}
};

class SystemBusSectionParser final : public IniSectionParser {
	SystemBusConfig &config;

public:
	explicit SystemBusSectionParser(SystemBusConfig &_config) noexcept
		:config(_config) {}

	void Property(std::string_view name, FileLineParser &line) override {
		if (name == "enabled"sv)
			config.enabled = line.ExpectBoolAndEnd();
		else if (name == "device_broker"sv)
			config.device_broker = line.ExpectBoolAndEnd();
		else
			ThrowUnknownProperty(name);
	}
};

static RelayConfig::Mode
ParseRelayMode(const char *s)
{
	if (strcmp(s, "bus") == 0)
		return RelayConfig::Mode::BUS;
	else if (strcmp(s, "socket") == 0)
		return RelayConfig::Mode::SOCKET;
	else
		throw LineParser::Error{"'bus' or 'socket' expected"};
}

class RelaySectionParser final : public IniSectionParser {
	RelayConfig &config;

public:
	explicit RelaySectionParser(RelayConfig &_config) noexcept
		:config(_config) {}

	void Property(std::string_view name, FileLineParser &line) override {
		if (name == "mode"sv)
			config.mode = ParseRelayMode(line.ExpectValueAndEnd());
		else if (name == "socket"sv)
			config.socket_path = line.ExpectPathAndEnd().native();
		else if (name == "timeout"sv)
			config.timeout = std::min<std::chrono::milliseconds>(std::chrono::milliseconds{line.ExpectPositiveIntegerAndEnd()},
									     RelayConfig::MAX_TIMEOUT);
		else if (name == "chunk_size"sv)
			config.chunk_size = line.ExpectPositiveIntegerAndEnd();
		else
			ThrowUnknownProperty(name);
	}
};

class BrokerRelayConfigParser final : public IniFileParser {
	Config &config;

public:
	explicit BrokerRelayConfigParser(Config &_config) noexcept
		:config(_config) {}

	std::unique_ptr<IniSectionParser> Section(std::string_view name) override {
		if (name == "listener"sv)
			return std::make_unique<ListenerSectionParser>(config.listener);
		else if (name == "system_bus"sv)
			return std::make_unique<SystemBusSectionParser>(config.system_bus);
		else if (name == "relay"sv)
			return std::make_unique<RelaySectionParser>(config.relay);
		else
			return nullptr;
	}
};

void
LoadConfigFile(Config &config, const std::filesystem::path &path)
{
	BrokerRelayConfigParser parser{config};
	CommentConfigParser comment_parser{parser};
	ParseOptionalConfigFile(path, comment_parser);
}

} // namespace Broker
