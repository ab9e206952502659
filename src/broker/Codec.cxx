// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Codec.hxx"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Broker {

std::optional<Request>
ParseRequest(std::string_view src)
{
	/* parse without exceptions; a parser error means the
	   request is incomplete */
	const auto j = json::parse(src, nullptr, false);
	if (j.is_discarded() || !j.is_object() || j.size() != 1)
		return std::nullopt;

	const auto i = j.begin();
	const auto operation = ParseOperation(i.key());
	if (!operation)
		return std::nullopt;

	const auto &args = i.value();
	if (!args.is_array() || args.size() != 3)
		return std::nullopt;

	for (const auto &arg : args)
		if (!arg.is_string())
			return std::nullopt;

	return Request{
		*operation,
		args[0].get<std::string>(),
		args[1].get<std::string>(),
		args[2].get<std::string>(),
	};
}

std::optional<Request>
DecodeRequest(std::string &buffer)
{
	auto request = ParseRequest(buffer);
	if (request)
		/* clear the buffer for the next request */
		buffer.clear();

	return request;
}

std::string
EncodeRequest(Operation operation,
	      std::string_view protocol_version,
	      std::string_view correlation_id,
	      std::string_view request_json)
{
	json j = json::object();
	j[ToString(operation)] = json::array({
			protocol_version,
			correlation_id,
			request_json,
		});
	return j.dump();
}

} // namespace Broker
