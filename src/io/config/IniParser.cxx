// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "IniParser.hxx"
#include "FileLineParser.hxx"

#include <fmt/format.h>

void
IniFileParser::ParseLine(FileLineParser &line)
{
	if (line.SkipSymbol('[')) {
		line.Strip();

		const char *name =
			line.ExpectWordAndSymbol(']',
						 "Section name expected",
						 "']' expected");
		line.ExpectEnd();

		if (child) {
			child->Finish();
			child.reset();
		}

		child = Section(name);
		if (!child)
			throw LineParser::Error{fmt::format("Unknown section '{}'",
							    name)};
	} else if (child) {
		const char *name =
			line.ExpectWordAndSymbol('=',
						 "Property name expected",
						 "'=' expected");
		child->Property(name, line);
		line.ExpectEnd();
	} else {
		throw LineParser::Error{"Section header expected"};
	}
}

void
IniFileParser::Finish()
{
	if (child) {
		child->Finish();
		child.reset();
	}
}
