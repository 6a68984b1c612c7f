// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_RESPONSE_HXX
#define DLNAQ_RESPONSE_HXX

#include "protocol/Ack.hxx"

#include <fmt/core.h>

#include <string_view>

class Client;

class Response {
	Client &client;

	/**
	 * This command's name.  Used to generate error messages.
	 */
	const char *command = "";

public:
	explicit Response(Client &_client) noexcept
		:client(_client) {}

	Response(const Response &) = delete;
	Response &operator=(const Response &) = delete;

	void SetCommand(const char *_command) noexcept {
		command = _command;
	}

	void Write(std::string_view s) noexcept;

	void VFmt(fmt::string_view format_str, fmt::format_args args) noexcept;

	template<typename S, typename... Args>
	void Fmt(const S &format_str, Args&&... args) noexcept {
		VFmt(format_str, fmt::make_format_args(args...));
	}

	void Error(enum ack code, std::string_view msg) noexcept;

	void VFmtError(enum ack code,
		       fmt::string_view format_str, fmt::format_args args) noexcept;

	template<typename S, typename... Args>
	void FmtError(enum ack code,
		      const S &format_str, Args&&... args) noexcept {
		VFmtError(code, format_str, fmt::make_format_args(args...));
	}
};

#endif
