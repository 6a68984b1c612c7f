// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config.h"
#include "Instance.hxx"
#include "CommandLine.hxx"
#include "ListenAddress.hxx"
#include "LogBackend.hxx"
#include "Log.hxx"
#include "client/Client.hxx"
#include "command/AllCommands.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "util/Domain.hxx"

#include <cstdlib>
#include <iostream>
#include <string>

#include <signal.h>
#include <stdio.h>

static constexpr Domain main_domain("main");

static DiscoveryConfig
LoadDiscoveryConfig(const ConfigData &config)
{
	using std::chrono::seconds;

	DiscoveryConfig c;
	c.search_timeout = config.GetDuration(ConfigOption::DISCOVERY_TIMEOUT,
					      seconds(1), c.search_timeout);
	c.cache_ttl = config.GetDuration(ConfigOption::DISCOVERY_CACHE_TTL,
					 seconds(0), c.cache_ttl);
	c.http_timeout = config.GetDuration(ConfigOption::HTTP_TIMEOUT,
					    seconds(1), c.http_timeout);
	return c;
}

static void
ConfigureLogging(const CommandLineOptions &options, const ConfigData &config)
{
	if (options.verbose)
		/* the command line wins */
		return;

	if (const char *value = config.GetString(ConfigOption::LOG_LEVEL))
		SetLogThreshold(ParseLogLevel(value));
}

/**
 * Read requests from standard input until "close" or end of file.
 */
static void
RunClient(Client &client)
{
	std::string line;
	while (std::getline(std::cin, line)) {
		const auto result = client.ProcessLine(line.data());

		const auto output = client.TakeOutput();
		fwrite(output.data(), 1, output.size(), stdout);
		fflush(stdout);

		if (result == CommandResult::CLOSE)
			break;
	}
}

static inline void
MainConfigured(const CommandLineOptions &options, const ConfigData &config)
{
	ConfigureLogging(options, config);

	const auto discovery_config = LoadDiscoveryConfig(config);
	const auto listen_address =
		GetListenAddress(config.GetString(ConfigOption::LISTEN_ADDRESS));
	const unsigned listen_port =
		config.GetPort(ConfigOption::LISTEN_PORT, 0);

	/* stdout may be a pipe whose reader is gone */
	signal(SIGPIPE, SIG_IGN);

	command_init();

	Instance instance(discovery_config, listen_address, listen_port);

	FmtInfo(main_domain, PACKAGE " " VERSION " ready, listening on {}",
		listen_address);

	Client client(instance.discovery, instance.sessions);
	RunClient(client);

	LogInfo(main_domain, "Shutting down");
	instance.sessions.StopAll();
}

static inline void
MainOrThrow(int argc, char *argv[])
{
	CommandLineOptions options;
	ConfigData config;

	ParseCommandLine(argc, argv, options, config);

	MainConfigured(options, config);
}

int
main(int argc, char *argv[]) noexcept
try {
	MainOrThrow(argc, argv);
	return EXIT_SUCCESS;
} catch (...) {
	LogError(std::current_exception());
	return EXIT_FAILURE;
}
