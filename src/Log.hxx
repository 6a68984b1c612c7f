// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_LOG_HXX
#define DLNAQ_LOG_HXX

#include "LogLevel.hxx"

#include <fmt/core.h>

#include <exception>
#include <string_view>

class Domain;

/**
 * Write one line to the log backend, prefixed with the name of the
 * #Domain.  Messages below the configured threshold are discarded.
 * May be called from any thread.
 */
void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept;

/**
 * Log the full message of an exception (including nested ones).
 */
void
Log(LogLevel level, const std::exception_ptr &ep) noexcept;

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
void
LogFmt(LogLevel level, const Domain &domain,
       const S &format_str, Args&&... args) noexcept
{
	LogVFmt(level, domain, format_str, fmt::make_format_args(args...));
}

template<typename S, typename... Args>
void
FmtDebug(const Domain &domain, const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::DEBUG, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtInfo(const Domain &domain, const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::INFO, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtNotice(const Domain &domain, const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::NOTICE, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtWarning(const Domain &domain, const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::WARNING, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtError(const Domain &domain, const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::ERROR, domain, format_str, args...);
}

inline void
LogDebug(const Domain &domain, std::string_view msg) noexcept
{
	Log(LogLevel::DEBUG, domain, msg);
}

inline void
LogInfo(const Domain &domain, std::string_view msg) noexcept
{
	Log(LogLevel::INFO, domain, msg);
}

inline void
LogError(const std::exception_ptr &ep) noexcept
{
	Log(LogLevel::ERROR, ep);
}

#endif
