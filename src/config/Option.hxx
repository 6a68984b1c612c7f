// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CONFIG_OPTION_HXX
#define DLNAQ_CONFIG_OPTION_HXX

#include <cstdint>

enum class ConfigOption : uint8_t {
	/**
	 * The local address for UPnP event callbacks.
	 */
	LISTEN_ADDRESS,

	LISTEN_PORT,

	/**
	 * How long each SSDP search waits for responses.
	 */
	DISCOVERY_TIMEOUT,

	DISCOVERY_CACHE_TTL,
	HTTP_TIMEOUT,
	LOG_LEVEL,
	MAX
};

/**
 * @return #ConfigOption::MAX if not found
 */
[[gnu::pure]]
ConfigOption
ParseConfigOptionName(const char *name) noexcept;

[[gnu::const]]
const char *
GetConfigOptionName(ConfigOption option) noexcept;

#endif
