// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CONFIG_PARSER_HXX
#define DLNAQ_CONFIG_PARSER_HXX

#include <chrono>

/*
 * Parsers for configuration values.  They throw std::runtime_error
 * on malformed input.
 */

unsigned
ParseUnsigned(const char *s);

/**
 * Parse a number of seconds.
 */
std::chrono::steady_clock::duration
ParseDuration(const char *s);

#endif
