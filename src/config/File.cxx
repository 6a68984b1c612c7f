// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "File.hxx"
#include "Data.hxx"
#include "Param.hxx"
#include "util/Tokenizer.hxx"
#include "util/StringStrip.hxx"
#include "util/Domain.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <cassert>
#include <cerrno>
#include <fstream>
#include <string>
#include <system_error>

static constexpr char CONF_COMMENT = '#';

static constexpr Domain config_file_domain("config_file");

/**
 * Read a string value as the last token of a line.  Throws on error.
 */
static const char *
ExpectValueAndEnd(Tokenizer &tokenizer)
{
	const char *value = tokenizer.NextString();
	if (value == nullptr)
		throw std::runtime_error("Value missing");

	if (!tokenizer.IsEnd() && tokenizer.CurrentChar() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	return value;
}

static void
ReadConfigLine(ConfigData &config_data, char *line, unsigned line_number)
{
	/* the first token in each line is the name, followed by the
	   value */

	Tokenizer tokenizer(line);
	const char *name = tokenizer.NextWord();
	assert(name != nullptr);

	const ConfigOption o = ParseConfigOptionName(name);
	if (o == ConfigOption::MAX)
		throw FmtRuntimeError("unrecognized parameter: {}", name);

	if (config_data.GetParam(o) != nullptr)
		FmtDebug(config_file_domain,
			 "config parameter {:?} redefined on line {}",
			 name, line_number);

	config_data.SetParam(o, ConfigParam(ExpectValueAndEnd(tokenizer),
					    line_number));
}

void
ReadConfigFile(ConfigData &config_data, std::istream &is, const char *name)
{
	std::string buffer;
	unsigned line_number = 0;

	try {
		while (std::getline(is, buffer)) {
			++line_number;

			char *line = StripLeft(buffer.data());
			if (*line == 0 || *line == CONF_COMMENT)
				continue;

			ReadConfigLine(config_data, line, line_number);
		}
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {} line {}",
						       name, line_number));
	}
}

void
ReadConfigFile(ConfigData &config_data, const char *path)
{
	FmtDebug(config_file_domain, "loading file {}", path);

	std::ifstream file(path);
	if (!file)
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to open {}", path));

	ReadConfigFile(config_data, file, path);
}
