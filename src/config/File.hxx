// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CONFIG_FILE_HXX
#define DLNAQ_CONFIG_FILE_HXX

#include <istream>

struct ConfigData;

/**
 * Load a configuration file.  Throws on error; the message names the
 * file and the line.
 */
void
ReadConfigFile(ConfigData &config_data, const char *path);

/**
 * Parse configuration lines from a stream.  Throws on error.
 *
 * @param name the file name for error messages
 */
void
ReadConfigFile(ConfigData &config_data, std::istream &is, const char *name);

#endif
