// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/format.h>

#include <exception>
#include <memory>

#include <errno.h>
#include <stdio.h>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(FileLineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(FileLineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

struct FileCloser {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

using UniqueFile = std::unique_ptr<FILE, FileCloser>;

static void
ParseConfigFile(const std::filesystem::path &path, FILE *file,
		ConfigParser &parser)
{
	char buffer[4096];
	unsigned i = 1;
	while (fgets(buffer, sizeof(buffer), file) != nullptr) {
		FileLineParser line_parser(path, buffer);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), i)});
		}

		++i;
	}

	if (ferror(file))
		throw FmtErrno("Failed to read {}", path.native());
}

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	const UniqueFile file{fopen(path.c_str(), "re")};
	if (!file)
		throw FmtErrno("Failed to open {}", path.native());

	ParseConfigFile(path, file.get(), parser);
	parser.Finish();
}

bool
ParseOptionalConfigFile(const std::filesystem::path &path,
			ConfigParser &parser)
{
	const UniqueFile file{fopen(path.c_str(), "re")};
	if (!file) {
		const int e = errno;
		switch (e) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return false;

		default:
			throw FmtErrno(e, "Failed to open {}", path.native());
		}
	}

	ParseConfigFile(path, file.get(), parser);
	parser.Finish();
	return true;
}
