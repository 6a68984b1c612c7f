// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Response.hxx"
#include "Client.hxx"

#include <fmt/format.h>

#include <iterator>

void
Response::Write(std::string_view s) noexcept
{
	client.Write(s);
}

void
Response::VFmt(fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	Write({buffer.data(), buffer.size()});
}

void
Response::Error(enum ack code, std::string_view msg) noexcept
{
	Fmt(FMT_STRING("ACK [{}@0] {{{}}} {}\n"), (int)code, command, msg);
}

void
Response::VFmtError(enum ack code,
		    fmt::string_view format_str, fmt::format_args args) noexcept
{
	Fmt(FMT_STRING("ACK [{}@0] {{{}}} "), (int)code, command);
	VFmt(format_str, args);
	Write("\n");
}
