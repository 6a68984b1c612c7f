// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Log.hxx"
#include "LogBackend.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <iterator>

static constexpr Domain exception_domain("exception");

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!IsLogEnabled(level))
		/* don't bother formatting */
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	Log(level, domain, {buffer.data(), buffer.size()});
}

void
Log(LogLevel level, const std::exception_ptr &ep) noexcept
{
	if (IsLogEnabled(level))
		Log(level, exception_domain, GetFullMessage(ep));
}
