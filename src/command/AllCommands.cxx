// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "AllCommands.hxx"
#include "CommandError.hxx"
#include "Request.hxx"
#include "RendererCommands.hxx"
#include "client/Client.hxx"
#include "client/Response.hxx"
#include "util/Tokenizer.hxx"

#include <fmt/format.h>

#include <cassert>
#include <iterator>

#include <string.h>

/*
 * The most arguments any command takes is two; add one extra to
 * catch errors clients may send us
 */
static constexpr std::size_t COMMAND_ARGV_MAX = 3;

/* if min: -1 don't check args *
 * if max: -1 no max args      */
struct command {
	const char *cmd;
	int min;
	int max;
	CommandResult (*handler)(Client &client, Request request, Response &response);
};

static CommandResult
handle_close([[maybe_unused]] Client &client, [[maybe_unused]] Request args,
	     [[maybe_unused]] Response &r)
{
	return CommandResult::CLOSE;
}

/**
 * The command registry.
 *
 * This array must be sorted!
 */
static constexpr struct command commands[] = {
	{ "close", -1, -1, handle_close },
	{ "list_renderers", 0, 1, handle_list_renderers },
	{ "next", 1, 1, handle_next },
	{ "pause", 1, 1, handle_pause },
	{ "play", 2, 2, handle_play },
	{ "previous", 1, 1, handle_previous },
	{ "resume", 1, 1, handle_resume },
	{ "setvol", 2, 2, handle_setvol },
	{ "status", 1, 1, handle_status },
	{ "stop", 1, 1, handle_stop },
};

static constexpr unsigned num_commands = std::size(commands);

void
command_init() noexcept
{
#ifndef NDEBUG
	/* ensure that the command list is sorted */
	for (unsigned i = 0; i < num_commands - 1; ++i)
		assert(strcmp(commands[i].cmd, commands[i + 1].cmd) < 0);
#endif
}

[[gnu::pure]]
static const struct command *
command_lookup(const char *name) noexcept
{
	unsigned a = 0, b = num_commands, i;

	/* binary search */
	do {
		i = (a + b) / 2;

		const auto cmp = strcmp(name, commands[i].cmd);
		if (cmp == 0)
			return &commands[i];
		else if (cmp < 0)
			b = i;
		else if (cmp > 0)
			a = i + 1;
	} while (a < b);

	return nullptr;
}

static bool
command_check_request(const struct command *cmd, Response &r,
		      Request args) noexcept
{
	const int min = cmd->min;
	const int max = cmd->max;

	if (min < 0)
		return true;

	if (min == max && unsigned(max) != args.size()) {
		r.FmtError(ACK_ERROR_ARG,
			   FMT_STRING("wrong number of arguments for \"{}\""),
			   cmd->cmd);
		return false;
	} else if (args.size() < unsigned(min)) {
		r.FmtError(ACK_ERROR_ARG,
			   FMT_STRING("too few arguments for \"{}\""),
			   cmd->cmd);
		return false;
	} else if (max >= 0 && args.size() > unsigned(max)) {
		r.FmtError(ACK_ERROR_ARG,
			   FMT_STRING("too many arguments for \"{}\""),
			   cmd->cmd);
		return false;
	} else
		return true;
}

static const struct command *
command_checked_lookup(Response &r, const char *cmd_name,
		       Request args) noexcept
{
	const struct command *cmd = command_lookup(cmd_name);
	if (cmd == nullptr) {
		r.FmtError(ACK_ERROR_UNKNOWN,
			   FMT_STRING("unknown command \"{}\""), cmd_name);
		return nullptr;
	}

	r.SetCommand(cmd->cmd);

	if (!command_check_request(cmd, r, args))
		return nullptr;

	return cmd;
}

CommandResult
command_process(Client &client, char *line) noexcept
{
	Response r(client);

	Tokenizer tokenizer(line);

	const char *cmd_name;
	try {
		cmd_name = tokenizer.NextWord();
		if (cmd_name == nullptr) {
			r.Error(ACK_ERROR_UNKNOWN, "No command given");
			return CommandResult::ERROR;
		}
	} catch (const std::exception &e) {
		r.Error(ACK_ERROR_UNKNOWN, e.what());
		return CommandResult::ERROR;
	}

	const char *argv[COMMAND_ARGV_MAX];
	std::size_t argc = 0;

	try {
		/* now parse the arguments (quoted or unquoted) */

		while (true) {
			if (argc == COMMAND_ARGV_MAX) {
				r.Error(ACK_ERROR_ARG, "Too many arguments");
				return CommandResult::ERROR;
			}

			const char *a = tokenizer.NextParam();
			if (a == nullptr)
				break;

			argv[argc++] = a;
		}
	} catch (const std::exception &e) {
		r.Error(ACK_ERROR_ARG, e.what());
		return CommandResult::ERROR;
	}

	const Request args{{argv, argc}};

	/* look up and invoke the command handler */

	const struct command *cmd =
		command_checked_lookup(r, cmd_name, args);
	if (cmd == nullptr)
		return CommandResult::ERROR;

	try {
		return cmd->handler(client, args, r);
	} catch (...) {
		PrintError(r, std::current_exception());
		return CommandResult::ERROR;
	}
}
