// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config.h"
#include "CommandLine.hxx"
#include "LogBackend.hxx"
#include "Log.hxx"
#include "config/Data.hxx"
#include "config/File.hxx"
#include "cmdline/OptionDef.hxx"
#include "cmdline/OptionParser.hxx"
#include "util/Domain.hxx"

#include <fmt/core.h>

#include <cstdlib>
#include <stdexcept>

enum Option {
	OPTION_CONFIG,
	OPTION_VERBOSE,
	OPTION_TIMESTAMPS,
	OPTION_VERSION,
	OPTION_HELP,
	OPTION_HELP2,
};

static constexpr OptionDef option_defs[] = {
	{"config", 'c', true, "load settings from this file"},
	{"verbose", 'v', "verbose logging"},
	{"timestamps", "prefix log messages with a timestamp"},
	{"version", 'V', "print version number"},
	{"help", 'h', "show help options"},
	{nullptr, '?', nullptr}, // hidden, standard alias for --help
};

static constexpr Domain cmdline_domain("cmdline");

[[noreturn]]
static void
version()
{
	fmt::print("DLNA Queue Daemon " VERSION "\n"
		   "\n"
		   "Features:"
#ifdef ENABLE_UPNP
		   " upnp"
#endif
		   " curl expat"
		   "\n"
		   "\n"
		   "This is free software; see the source for copying conditions.  There is NO\n"
		   "warranty; not even MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.\n");

	std::exit(EXIT_SUCCESS);
}

static void
PrintOption(const OptionDef &opt)
{
	const char *value = opt.HasValue() ? " FILE" : "";

	if (opt.HasShortOption())
		fmt::print("  -{}, --{:<14}{}\n",
			   opt.GetShortOption(),
			   fmt::format("{}{}", opt.GetLongOption(), value),
			   opt.GetDescription());
	else
		fmt::print("  --{:<18}{}\n",
			   fmt::format("{}{}", opt.GetLongOption(), value),
			   opt.GetDescription());
}

[[noreturn]]
static void
help()
{
	fmt::print("Usage:\n"
		   "  " PACKAGE "d [OPTION...] [path/to/" PACKAGE ".conf]\n"
		   "\n"
		   "Plays track queues on DLNA media renderers.  Commands are\n"
		   "read from standard input, one per line.\n"
		   "\n"
		   "Options:\n");

	for (const auto &i : option_defs)
		if (i.HasDescription())
			PrintOption(i);

	std::exit(EXIT_SUCCESS);
}

void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config)
{
	const char *config_file = nullptr;

	OptionParser parser(option_defs, argc, argv);
	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_CONFIG:
			config_file = o.value;
			break;

		case OPTION_VERBOSE:
			options.verbose = true;
			break;

		case OPTION_TIMESTAMPS:
			options.log_timestamps = true;
			break;

		case OPTION_VERSION:
			version();

		case OPTION_HELP:
		case OPTION_HELP2:
			help();
		}
	}

	/* configure logging early, so the configuration file parser
	   can use it already */
	if (options.verbose)
		SetLogThreshold(LogLevel::DEBUG);
	if (options.log_timestamps)
		EnableLogTimestamp();

	for (const char *i : parser.GetRemaining()) {
		if (config_file != nullptr)
			throw std::runtime_error("too many arguments");

		config_file = i;
	}

	if (config_file == nullptr) {
		LogDebug(cmdline_domain, "No configuration file, using defaults");
		return;
	}

	ReadConfigFile(config, config_file);
}
