// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Option.hxx"

#include <iterator>

#include <string.h>

static constexpr const char *config_option_names[] = {
	"listen_address",
	"listen_port",
	"discovery_timeout",
	"discovery_cache_ttl",
	"http_timeout",
	"log_level",
};

static_assert(std::size(config_option_names) == std::size_t(ConfigOption::MAX),
	      "Wrong number of config_option_names");

ConfigOption
ParseConfigOptionName(const char *name) noexcept
{
	for (std::size_t i = 0; i < std::size(config_option_names); ++i)
		if (strcmp(config_option_names[i], name) == 0)
			return ConfigOption(i);

	return ConfigOption::MAX;
}

const char *
GetConfigOptionName(ConfigOption option) noexcept
{
	return config_option_names[std::size_t(option)];
}
