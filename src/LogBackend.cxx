// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"

#include <fmt/chrono.h>

#include <atomic>
#include <mutex>

#include <stdio.h>
#include <string.h>
#include <time.h>

using std::string_view_literals::operator""sv;

static std::atomic<LogLevel> log_threshold{LogLevel::NOTICE};

static std::atomic_bool enable_timestamp;

/**
 * Serializes output from libupnp/libcurl callback threads and the
 * main thread so lines don't interleave.
 */
static std::mutex log_mutex;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold = _threshold;
}

void
EnableLogTimestamp() noexcept
{
	enable_timestamp = true;
}

bool
IsLogEnabled(LogLevel level) noexcept
{
	return level >= log_threshold;
}

LogLevel
ParseLogLevel(const char *value)
{
	if (strcmp(value, "default") == 0)
		return LogLevel::NOTICE;
	else if (strcmp(value, "info") == 0)
		return LogLevel::INFO;
	else if (strcmp(value, "verbose") == 0)
		return LogLevel::DEBUG;
	else
		throw FmtRuntimeError("unknown log level {:?}", value);
}

static void
FileLog(const Domain &domain, std::string_view message) noexcept
{
	const std::scoped_lock lock{log_mutex};

	if (enable_timestamp) {
		const time_t t = time(nullptr);
		struct tm tm;
		if (localtime_r(&t, &tm) != nullptr)
			fmt::print(stderr, "{:%FT%T} ", tm);
	}

	fmt::print(stderr, "{}: {}\n",
		   domain.GetName(),
		   StripRight(message));
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (!IsLogEnabled(level))
		return;

	FileLog(domain, msg);
}
