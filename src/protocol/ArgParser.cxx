// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ArgParser.hxx"
#include "Ack.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <climits>

#include <stdlib.h>
#include <string.h>

static inline ProtocolError
MakeArgError(const char *msg, const char *value)
{
	return {ACK_ERROR_ARG, fmt::format("{}: {}", msg, value)};
}

int
ParseCommandArgInt(const char *s)
{
	char *test;
	errno = 0;
	const long value = strtol(s, &test, 10);
	if (test == s || *test != '\0')
		throw MakeArgError("Integer expected", s);

	if (errno == ERANGE || value < INT_MIN || value > INT_MAX)
		throw MakeArgError("Number too large", s);

	return int(value);
}

bool
ParseCommandArgForce(const char *s)
{
	if (strcmp(s, "force") == 0 || strcmp(s, "1") == 0)
		return true;

	if (strcmp(s, "0") == 0)
		return false;

	throw MakeArgError("\"force\" or boolean (0/1) expected", s);
}

unsigned
ParseCommandArgVolume(const char *s)
{
	return unsigned(std::clamp(ParseCommandArgInt(s), 0, 100));
}
