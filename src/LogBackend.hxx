// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_LOG_BACKEND_HXX
#define DLNAQ_LOG_BACKEND_HXX

#include "LogLevel.hxx"

void
SetLogThreshold(LogLevel _threshold) noexcept;

void
EnableLogTimestamp() noexcept;

/**
 * Would a message with this level be written?
 */
[[gnu::pure]]
bool
IsLogEnabled(LogLevel level) noexcept;

/**
 * Parse a "log_level" setting ("default", "info" or "verbose").
 * Throws std::runtime_error on error.
 */
LogLevel
ParseLogLevel(const char *value);

#endif
