// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CLIENT_HXX
#define DLNAQ_CLIENT_HXX

#include "command/CommandResult.hxx"

#include <string>
#include <string_view>
#include <utility>

class DiscoveryEngine;
class SessionRegistry;

/**
 * The peer of the line based command protocol.  Responses are
 * collected in an output buffer which the caller fetches with
 * TakeOutput() after each request.
 */
class Client final {
	DiscoveryEngine &discovery;
	SessionRegistry &sessions;

	std::string output;

	/**
	 * Number of requests processed so far; used for log
	 * messages.
	 */
	unsigned num = 0;

public:
	Client(DiscoveryEngine &_discovery,
	       SessionRegistry &_sessions) noexcept
		:discovery(_discovery), sessions(_sessions) {}

	Client(const Client &) = delete;
	Client &operator=(const Client &) = delete;

	DiscoveryEngine &GetDiscovery() const noexcept {
		return discovery;
	}

	SessionRegistry &GetSessions() const noexcept {
		return sessions;
	}

	void Write(std::string_view s) noexcept {
		output.append(s);
	}

	void WriteOK() noexcept {
		Write("OK\n");
	}

	/**
	 * Returns and clears everything written since the last
	 * call.
	 */
	std::string TakeOutput() noexcept {
		return std::exchange(output, std::string{});
	}

	/**
	 * Process one request line and append the response
	 * (including "OK" or "ACK") to the output buffer.
	 *
	 * @return CommandResult::CLOSE if the client has asked to end
	 * the session
	 */
	CommandResult ProcessLine(char *line) noexcept;
};

#endif
