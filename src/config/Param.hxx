// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CONFIG_PARAM_HXX
#define DLNAQ_CONFIG_PARAM_HXX

#include <string>

/**
 * One setting loaded from the configuration file.
 */
struct ConfigParam {
	std::string value;

	/**
	 * The line number in the configuration file, for error
	 * messages.
	 */
	unsigned line;

	ConfigParam(const char *_value, unsigned _line)
		:value(_value), line(_line) {}
};

#endif
