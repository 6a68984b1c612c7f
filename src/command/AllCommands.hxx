// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_ALL_COMMANDS_HXX
#define DLNAQ_ALL_COMMANDS_HXX

#include "CommandResult.hxx"

class Client;

void
command_init() noexcept;

/**
 * Parse one request line and invoke its command handler.  Errors are
 * sent to the client as "ACK" lines.
 */
CommandResult
command_process(Client &client, char *line) noexcept;

#endif
