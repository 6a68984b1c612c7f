// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_COMMAND_LINE_HXX
#define DLNAQ_COMMAND_LINE_HXX

struct ConfigData;

struct CommandLineOptions {
	bool verbose = false;
	bool log_timestamps = false;
};

/**
 * Parse the command line and load the configuration file named by
 * "--config" (or the single non-option argument) into #config.
 * "--help" and "--version" print and exit.  Throws on error.
 */
void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config);

#endif
