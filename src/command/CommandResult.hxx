// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_COMMAND_RESULT_HXX
#define DLNAQ_COMMAND_RESULT_HXX

enum class CommandResult {
	/**
	 * The command has succeeded, but the "OK" response was not
	 * yet sent to the client.
	 */
	OK,

	/**
	 * There was an error.  The "ACK" response was sent to the
	 * client.
	 */
	ERROR,

	/**
	 * The client has asked to end the session.
	 */
	CLOSE,
};

#endif
