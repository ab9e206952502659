// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <filesystem>

class FileLineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual bool PreParseLine(FileLineParser &line);
	virtual void ParseLine(FileLineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores lines starting with '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) final;
	void Finish() override;
};

/**
 * Throws on error.  Errors in a line are wrapped in a nested
 * exception which names the file and the line number.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);

/**
 * Like ParseConfigFile(), but a missing file is not an error.
 *
 * @return false if the file does not exist
 */
bool
ParseOptionalConfigFile(const std::filesystem::path &path,
			ConfigParser &parser);
