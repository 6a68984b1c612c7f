// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Parser.hxx"

#include <climits>
#include <cstdlib>
#include <stdexcept>

unsigned
ParseUnsigned(const char *s)
{
	char *endptr;
	const long value = strtol(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw std::runtime_error("Failed to parse number");

	if (value < 0)
		throw std::runtime_error("Value must not be negative");

	if (value > long(UINT_MAX))
		throw std::runtime_error("Value too large");

	return unsigned(value);
}

std::chrono::steady_clock::duration
ParseDuration(const char *s)
{
	return std::chrono::seconds(ParseUnsigned(s));
}
